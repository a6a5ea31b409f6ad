#include"Sqlite3/Detail/values.hpp"
#include"Sqlite3/Error.hpp"
#include<sqlite3.h>

namespace {

sqlite3_stmt* s(void* stmt) {
	return static_cast<sqlite3_stmt*>(stmt);
}

void check(int res) {
	if (res != SQLITE_OK)
		throw Sqlite3::Error("Query::bind", sqlite3_errstr(res));
}

}

namespace Sqlite3 { namespace Detail {

void bind_text(void* stmt, int l, std::string const& v) {
	check(sqlite3_bind_text( s(stmt), l, v.data(), int(v.size())
			       , SQLITE_TRANSIENT
			       ));
}
void bind_int(void* stmt, int l, std::int64_t v) {
	check(sqlite3_bind_int64(s(stmt), l, sqlite3_int64(v)));
}
void bind_null(void* stmt, int l) {
	check(sqlite3_bind_null(s(stmt), l));
}

std::string column_text(void* stmt, int c) {
	auto text = sqlite3_column_text(s(stmt), c);
	if (!text)
		return std::string();
	/* Only valid after the text conversion above.  */
	auto len = sqlite3_column_bytes(s(stmt), c);
	return std::string(reinterpret_cast<char const*>(text), std::size_t(len));
}
std::int64_t column_int(void* stmt, int c) {
	return std::int64_t(sqlite3_column_int64(s(stmt), c));
}
bool column_is_null(void* stmt, int c) {
	return sqlite3_column_type(s(stmt), c) == SQLITE_NULL;
}

}}
