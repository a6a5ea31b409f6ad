#ifndef EV_NOW_HPP
#define EV_NOW_HPP

#include<cstdint>

namespace Ev {

/* Wall-clock seconds since the epoch, as libev sees it.  */
double now();

/* The same, in whole milliseconds, which is how contract
 * and party records stamp their creation time.
 */
std::uint64_t now_ms();

}

#endif /* !defined(EV_NOW_HPP) */
