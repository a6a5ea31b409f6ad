#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Jsmn {

/* Thrown on malformed or incomplete JSON text.  */
class ParseError : public Util::BacktraceException<std::runtime_error> {
private:
	static
	std::string enmessage(std::string const& input, unsigned int i);

public:
	ParseError() =delete;
	ParseError(std::string const& input, unsigned int i)
		: Util::BacktraceException<std::runtime_error>(
			enmessage(input, i)
		  ) { }
	explicit
	ParseError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Jsmn::ParseError: " + msg
		  ) { }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
