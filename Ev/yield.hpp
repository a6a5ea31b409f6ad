#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets other greenthreads run before continuing.
 *
 * @desc Any state shared with other greenthreads may have
 * changed by the time this action completes.
 *
 * The counted form is mostly for tests, to let other
 * greenthreads make progress before checking their effects.
 */
Ev::Io<void> yield();
Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
