#ifndef ESCROW_MSG_SHUTDOWN_HPP
#define ESCROW_MSG_SHUTDOWN_HPP

namespace Escrow { namespace Msg {

/** struct Escrow::Msg::Shutdown
 *
 * @brief broadcast when the process is about to exit.
 * Pending timers fail with `Escrow::Shutdown`.
 */
struct Shutdown { };

}}

#endif /* !defined(ESCROW_MSG_SHUTDOWN_HPP) */
