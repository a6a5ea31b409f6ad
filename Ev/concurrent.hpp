#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief launches the given action as a new greenthread
 * once the current one yields, and completes immediately.
 *
 * @desc An exception escaping the launched action is
 * reported on stderr; the main loop keeps running.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* !defined(EV_CONCURRENT_HPP) */
