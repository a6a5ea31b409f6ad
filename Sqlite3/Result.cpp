#include"Sqlite3/Error.hpp"
#include"Sqlite3/Result.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

Result::Result(Sqlite3::Db const& db_, void* stmt_) : db(db_) {
	row.stmt = stmt_;
	advance();
}
Result::Result(Result&& o) : db(std::move(o.db)) {
	row.stmt = o.row.stmt;
	o.row.stmt = nullptr;
}
Result::~Result() {
	if (row.stmt)
		sqlite3_finalize(static_cast<sqlite3_stmt*>(row.stmt));
}

void Result::advance() {
	auto stmt = static_cast<sqlite3_stmt*>(row.stmt);
	auto res = sqlite3_step(stmt);
	if (res == SQLITE_ROW)
		return;

	sqlite3_finalize(stmt);
	row.stmt = nullptr;
	if (res == SQLITE_DONE)
		return;

	auto connection = static_cast<sqlite3*>(db.get_connection());
	throw Error("Result", sqlite3_errmsg(connection));
}

}
