#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief a shared handle to an SQLite3 database.
 *
 * @desc Copies share the same connection.
 * All access goes through `transact`, which hands out at
 * most one `Sqlite3::Tx` at a time; later callers block
 * (letting other greenthreads run) until it is finished.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Query;
	friend class Sqlite3::Result;
	friend class Sqlite3::Tx;

	void* get_connection() const;
	void transaction_finish();

public:
	/* ":memory:" opens a private in-memory database.  */
	explicit
	Db(std::string const& filename);

	/* An invalid handle, which cannot transact.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Ev::Io<Sqlite3::Tx> transact();
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
