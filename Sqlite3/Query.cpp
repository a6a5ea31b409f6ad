#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

class Query::Impl {
public:
	Db db;
	/* Owned until handed to the Result.  */
	sqlite3_stmt* stmt;

	Impl(Db const& db_, void* stmt_)
		: db(db_), stmt(static_cast<sqlite3_stmt*>(stmt_)) { }
	~Impl() {
		if (stmt)
			sqlite3_finalize(stmt);
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(Util::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&&) =default;
Query::~Query() =default;

void* Query::get_stmt() const {
	return pimpl->stmt;
}
int Query::get_location(char const* field) const {
	auto l = sqlite3_bind_parameter_index(pimpl->stmt, field);
	if (l == 0)
		throw Error("Query::bind", std::string("no parameter ") + field);
	return l;
}

Result Query::execute() {
	auto stmt = pimpl->stmt;
	pimpl->stmt = nullptr;
	auto db = pimpl->db;
	pimpl = nullptr;
	return Result(db, stmt);
}

}
