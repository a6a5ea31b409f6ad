#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief an open database transaction, obtained from
 * `Sqlite3::Db::transact`.
 *
 * @desc Move-only.
 * Unless `commit()` is called, the transaction is rolled
 * back when the object is destroyed, so an exception
 * thrown between the two leaves the database unchanged.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	/* An invalid transaction.  */
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const&);

	/* Runs statements that bind nothing and return nothing,
	 * such as table creation.
	 */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Both invalidate this object.  */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
