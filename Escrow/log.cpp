#include"Escrow/Msg/Log.hpp"
#include"Escrow/log.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Escrow {

std::string to_string(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

bool parse_log_level(std::string const& s, LogLevel& l) {
	auto t = Util::Str::tolower(Util::Str::trim(s));
	if (t == "trace")
		l = Trace;
	else if (t == "debug")
		l = Debug;
	else if (t == "info")
		l = Info;
	else if (t == "warn" || t == "warning")
		l = Warn;
	else if (t == "error")
		l = Error;
	else
		return false;
	return true;
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, char const* fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Msg::Log{l, std::move(msg)});
}

}
