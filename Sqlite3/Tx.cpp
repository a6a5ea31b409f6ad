#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/make_unique.hpp"
#include<iostream>
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool committed;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}
	void check(int res, char const* what) {
		if (res != SQLITE_OK)
			throw Error( std::string("Tx: ") + what
				   , sqlite3_errmsg(connection())
				   );
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_), committed(false) {
		check( sqlite3_exec(connection(), "BEGIN", nullptr, nullptr, nullptr)
		     , "BEGIN"
		     );
	}

	void commit() {
		check( sqlite3_exec(connection(), "COMMIT", nullptr, nullptr, nullptr)
		     , "COMMIT"
		     );
		committed = true;
	}

	~Impl() {
		if (!committed) {
			auto res = sqlite3_exec( connection(), "ROLLBACK"
					       , nullptr, nullptr, nullptr
					       );
			if (res != SQLITE_OK)
				std::cerr << "Sqlite3::Tx: ROLLBACK: "
					  << sqlite3_errmsg(connection())
					  << std::endl;
		}
		db.transaction_finish();
	}

	void query_execute(char const* q) {
		check( sqlite3_exec(connection(), q, nullptr, nullptr, nullptr)
		     , q
		     );
	}

	Query query(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		check( sqlite3_prepare_v2(connection(), sql, -1, &stmt, nullptr)
		     , sql
		     );
		return Query(db, stmt);
	}
};

Tx::Tx(Sqlite3::Db const& db)
	: pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto p = std::move(pimpl);
	p->commit();
}
void Tx::rollback() {
	pimpl = nullptr;
}

Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}
Query Tx::query(std::string const& q) {
	return query(q.c_str());
}

void Tx::query_execute(char const* q) {
	pimpl->query_execute(q);
}

}
