#ifndef ESCROW_WAITER_HPP
#define ESCROW_WAITER_HPP

#include<memory>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Escrow {

/** class Escrow::Waiter
 *
 * @brief timers on the event loop.
 *
 * @desc Every wait still running when
 * `Escrow::Msg::Shutdown` is raised fails with
 * `Escrow::Shutdown`, and later waits fail at once.
 * A wait of zero or fewer seconds just yields.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Waiter() =delete;
	Waiter(Waiter const&) =delete;

	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	Ev::Io<void> wait(double seconds);
};

}

#endif /* !defined(ESCROW_WAITER_HPP) */
