#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Tx.hpp"
#include<functional>
#include<queue>
#include<sqlite3.h>

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool in_transaction;
	std::queue<std::function<void(Sqlite3::Tx)>> blocked;

	void fail(char const* where) {
		auto msg = std::string(connection
				       ? sqlite3_errmsg(connection)
				       : "out of memory"
				       );
		if (connection)
			sqlite3_close_v2(connection);
		connection = nullptr;
		throw Error(std::string("Db: ") + where, msg);
	}

public:
	explicit
	Impl(std::string const& filename)
		: connection(nullptr), in_transaction(false) {
		if (sqlite3_open(filename.c_str(), &connection) != SQLITE_OK)
			fail("sqlite3_open");
		if (sqlite3_extended_result_codes(connection, 1) != SQLITE_OK)
			fail("sqlite3_extended_result_codes");
		if (sqlite3_exec( connection, "PRAGMA foreign_keys = ON;"
				, nullptr, nullptr, nullptr
				) != SQLITE_OK)
			fail("PRAGMA foreign_keys");
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Ev::Io<Sqlite3::Tx> transact(Db const& db) {
		auto ptx = std::make_shared<Sqlite3::Tx>();
		return Ev::Io<Sqlite3::Tx>([ this, db
					   ]( std::function<void(Sqlite3::Tx)> pass
					    , std::function<void(std::exception_ptr)>
					    ) {
			if (in_transaction) {
				blocked.push(std::move(pass));
			} else {
				in_transaction = true;
				pass(Sqlite3::Tx(db));
			}
		}).then([ptx](Sqlite3::Tx tx) {
			*ptx = std::move(tx);
			return Ev::yield();
		}).then([ptx]() {
			return Ev::lift(std::move(*ptx));
		});
	}
	void* get_connection() const { return connection; }
	void transaction_finish(Db const& db) {
		if (blocked.empty()) {
			in_transaction = false;
			return;
		}
		auto pass = std::move(blocked.front());
		blocked.pop();
		pass(Sqlite3::Tx(db));
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	pimpl->transaction_finish(*this);
}
Ev::Io<Sqlite3::Tx> Db::transact() {
	return pimpl->transact(*this);
}

Db::Db(std::string const& filename)
	: pimpl(std::make_shared<Impl>(filename)) { }

}
