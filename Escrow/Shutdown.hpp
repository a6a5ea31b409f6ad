#ifndef ESCROW_SHUTDOWN_HPP
#define ESCROW_SHUTDOWN_HPP

namespace Escrow {

/* Thrown by waits that were cut short by a shutdown.  */
struct Shutdown { };

}

#endif /* !defined(ESCROW_SHUTDOWN_HPP) */
