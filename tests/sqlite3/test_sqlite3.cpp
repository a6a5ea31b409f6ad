#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<map>

namespace {

std::map<std::string, std::string> read_all(Sqlite3::Tx& tx) {
	auto rv = std::map<std::string, std::string>();
	auto res = tx.query("SELECT address, record FROM \"Records\";")
		.execute()
		;
	for (auto& r : res)
		rv[r.get<std::string>(0)] = r.get<std::string>(1);
	return rv;
}

Ev::Io<void> put(Sqlite3::Db db, std::string k, std::string v) {
	return db.transact().then([k, v](Sqlite3::Tx tx) {
		tx.query("INSERT OR REPLACE INTO \"Records\" VALUES(:k, :v);")
			.bind(":k", k)
			.bind(":v", v)
			.execute()
			;
		tx.commit();
		return Ev::lift();
	});
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");
	assert(db);
	assert(!Sqlite3::Db());

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute(R"QRY(
		CREATE TABLE "Records"
		     ( address TEXT PRIMARY KEY
		     , record TEXT NOT NULL
		     );
		)QRY");
		tx.commit();
		assert(!tx);

		return put(db, "tark1a", "{\"v\":1}");
	}).then([&]() {
		/* A second write to the same key replaces the first.  */
		return put(db, "tark1a", "{\"v\":2}");
	}).then([&]() {
		/* Transactions queue behind each other.  */
		return Ev::concurrent(put(db, "tark1b", "b"))
		     .then([&]() { return Ev::concurrent(put(db, "tark1c", "c")); })
		     .then([]() { return Ev::yield(10); });
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto all = read_all(tx);
		assert(all.size() == 3);
		assert(all["tark1a"] == "{\"v\":2}");
		assert(all["tark1c"] == "c");

		/* Uncommitted changes are rolled back.  */
		tx.query("DELETE FROM \"Records\" WHERE address = :k;")
			.bind(":k", std::string("tark1b"))
			.execute()
			;
		tx.rollback();
		assert(!tx);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(read_all(tx).count("tark1b") == 1);

		/* A NOT NULL record is enforced.  */
		auto threw = false;
		try {
			tx.query("INSERT INTO \"Records\" VALUES(:k, NULL);")
				.bind(":k", std::string("tark1d"))
				.execute()
				;
		} catch (Sqlite3::Error const&) {
			threw = true;
		}
		assert(threw);

		threw = false;
		try {
			tx.query_execute("SELECT nothing FROM \"Nowhere\";");
		} catch (Sqlite3::Error const&) {
			threw = true;
		}
		assert(threw);
		tx.commit();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
