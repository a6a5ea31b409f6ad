#ifndef UTIL_MAKE_UNIQUE_HPP
#define UTIL_MAKE_UNIQUE_HPP

#include<memory>
#include<utility>

namespace Util {

/** Util::make_unique
 *
 * @brief `std::make_unique` for C++11, single objects
 * only.  Used to build the `pimpl` of classes that hide
 * their state.
 */
template<typename T, typename... As>
std::unique_ptr<T> make_unique(As&&... as) {
	return std::unique_ptr<T>(new T(std::forward<As>(as)...));
}

}

#endif /* UTIL_MAKE_UNIQUE_HPP */
