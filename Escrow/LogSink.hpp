#ifndef ESCROW_LOGSINK_HPP
#define ESCROW_LOGSINK_HPP

#include"Escrow/log.hpp"
#include<iosfwd>

namespace S { class Bus; }

namespace Escrow {

/** class Escrow::LogSink
 *
 * @brief writes every `Escrow::Msg::Log` at or above the
 * threshold as one line of JSON.
 *
 * @desc The line is `{"level":...,"time":...,"message":...}`,
 * with time in seconds from the event loop clock.
 */
class LogSink {
private:
	std::ostream& os;
	LogLevel threshold;

public:
	LogSink() =delete;
	LogSink(LogSink const&) =delete;

	/* Writes to std::cerr.  */
	LogSink(S::Bus& bus, LogLevel threshold);
	LogSink(S::Bus& bus, LogLevel threshold, std::ostream& os);

	void set_threshold(LogLevel l) { threshold = l; }
};

}

#endif /* !defined(ESCROW_LOGSINK_HPP) */
