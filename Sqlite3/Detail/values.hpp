#ifndef SQLITE3_DETAIL_VALUES_HPP
#define SQLITE3_DETAIL_VALUES_HPP

#include<cstddef>
#include<cstdint>
#include<string>

/* Conversions between C++ values and SQLite parameters and
 * columns.  Records are stored as TEXT; integers and NULL
 * cover the rest.
 */
namespace Sqlite3 { namespace Detail {

void bind_text(void* stmt, int l, std::string const&);
void bind_int(void* stmt, int l, std::int64_t);
void bind_null(void* stmt, int l);

std::string column_text(void* stmt, int c);
std::int64_t column_int(void* stmt, int c);
bool column_is_null(void* stmt, int c);

template<typename a>
struct Value;

template<>
struct Value<std::string> {
	static void bind(void* stmt, int l, std::string const& v) {
		bind_text(stmt, l, v);
	}
	static std::string column(void* stmt, int c) {
		return column_text(stmt, c);
	}
};
template<>
struct Value<char const*> {
	static void bind(void* stmt, int l, char const* v) {
		bind_text(stmt, l, v);
	}
};
template<>
struct Value<std::int64_t> {
	static void bind(void* stmt, int l, std::int64_t v) {
		bind_int(stmt, l, v);
	}
	static std::int64_t column(void* stmt, int c) {
		return column_int(stmt, c);
	}
};
template<>
struct Value<std::nullptr_t> {
	static void bind(void* stmt, int l, std::nullptr_t) {
		bind_null(stmt, l);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_VALUES_HPP) */
