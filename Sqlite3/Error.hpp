#ifndef SQLITE3_ERROR_HPP
#define SQLITE3_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Sqlite3 {

/* Thrown on any failure reported by libsqlite3.  */
class Error : public Util::BacktraceException<std::runtime_error> {
public:
	Error(std::string const& where, std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Sqlite3::" + where + ": " + msg
		  ) { }
};

}

#endif /* !defined(SQLITE3_ERROR_HPP) */
