#ifndef ESCROW_MSG_LOG_HPP
#define ESCROW_MSG_LOG_HPP

#include"Escrow/log.hpp"
#include<string>

namespace Escrow { namespace Msg {

/** struct Escrow::Msg::Log
 *
 * @brief raised by `Escrow::log` for each formatted
 * message.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(ESCROW_MSG_LOG_HPP) */
