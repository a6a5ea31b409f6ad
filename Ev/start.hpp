#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the libev main loop with the given action as
 * the first greenthread, returning the exit code it yields.
 *
 * @desc Returns 254 if the action throws, or 255 if the
 * event loop could not be created.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
