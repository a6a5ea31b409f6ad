#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/values.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement awaiting its parameters.
 *
 * @desc Usage:
 *
 *     tx.query("SELECT record FROM T WHERE k = :k;")
 *       .bind(":k", key)
 *       .execute();
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	void* get_stmt() const;
	int get_location(char const*) const;

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	/* Binds a named parameter such as `:name`.  */
	template<typename a>
	Query& bind(char const* field, a value) {
		Detail::Value<a>::bind(get_stmt(), get_location(field), value);
		return *this;
	}
	template<typename a>
	Query& bind(std::string const& field, a value) {
		return bind<a>(field.c_str(), value);
	}

	/* Unbound parameters are NULL.
	 * The query cannot be reused afterwards.
	 */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
