#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/values.hpp"
#include<iterator>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }

namespace Sqlite3 {

/* The current row of a result; columns count from 0.  */
class Row {
private:
	void* stmt;

	friend class Sqlite3::Result;
	Row() : stmt(nullptr) { }

public:
	Row(Row const&) =delete;

	template<typename a>
	a get(int c) const {
		return Detail::Value<a>::column(stmt, c);
	}
	bool is_null(int c) const {
		return Detail::column_is_null(stmt, c);
	}
};

/** class Sqlite3::Result
 *
 * @brief the rows produced by an executed query.
 *
 * @desc Single-pass: each row is gone once the iterator
 * moves past it.
 */
class Result {
private:
	Sqlite3::Db db;
	Row row;

	friend class Sqlite3::Query;
	Result(Sqlite3::Db const& db_, void* stmt_);

	/* Steps the statement, finalizing it at the end.  */
	void advance();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator {
	private:
		Result* r;

		friend class Sqlite3::Result;
		explicit iterator(Result* r_) : r(r_) { }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Row* pointer;
		typedef Row& reference;

		iterator() : r(nullptr) { }

		bool operator==(iterator const& o) const {
			return r == o.r;
		}
		bool operator!=(iterator const& o) const {
			return r != o.r;
		}

		iterator& operator++() {
			r->advance();
			if (!r->row.stmt)
				r = nullptr;
			return *this;
		}
		Row& operator*() const {
			return r->row;
		}
	};
	iterator begin() {
		return iterator(row.stmt ? this : nullptr);
	}
	iterator end() {
		return iterator();
	}
};

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
