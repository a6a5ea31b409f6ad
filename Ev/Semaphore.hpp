#ifndef EV_SEMAPHORE_HPP
#define EV_SEMAPHORE_HPP

#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<memory>
#include<utility>

namespace Ev {

namespace Detail {

template<typename a>
struct SemaphoreRunHelper {
	template<typename f>
	static
	Ev::Io<a> run(Ev::Io<a> action, f core_run) {
		auto presult = std::make_shared<std::unique_ptr<a>>();
		auto void_action = action.then([presult](a rv) {
			*presult = Util::make_unique<a>(std::move(rv));
			return Ev::lift();
		});
		return core_run(std::move(void_action)).then([presult]() {
			return Ev::lift(std::move(**presult));
		});
	}
};
template<>
struct SemaphoreRunHelper<void> {
	template<typename f>
	static
	Ev::Io<void> run(Ev::Io<void> action, f core_run) {
		return core_run(std::move(action));
	}
};

}

/** class Ev::Semaphore
 *
 * @brief limits how many greenthreads may be inside
 * `run` at once.
 *
 * @desc Extra callers queue in arrival order and resume
 * when a running action completes or throws.
 * A semaphore of 1 is a greenthread mutex.
 */
class Semaphore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Ev::Io<void> core_run(Ev::Io<void> action);

public:
	Semaphore() =delete;
	Semaphore(Semaphore const&) =delete;

	Semaphore(Semaphore&&);
	~Semaphore();
	explicit
	Semaphore(std::size_t max);

	/* Throws whatever the given action throws.  */
	template<typename a>
	Ev::Io<a> run(Ev::Io<a> action) {
		return Detail::SemaphoreRunHelper<a>::run( std::move(action)
							 , [this](Ev::Io<void> act) {
			return core_run(std::move(act));
		});
	}
};

}

#endif /* !defined(EV_SEMAPHORE_HPP) */
