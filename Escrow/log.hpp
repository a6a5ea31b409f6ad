#ifndef ESCROW_LOG_HPP
#define ESCROW_LOG_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Escrow {

enum LogLevel
{ Trace
, Debug
, Info
, Warn
, Error
};

/* "trace", "debug", "info", "warn", "error".  */
std::string to_string(LogLevel);
bool parse_log_level(std::string const&, LogLevel&);

Ev::Io<void> log(S::Bus& bus, LogLevel l, char const* fmt, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* !defined(ESCROW_LOG_HPP) */
