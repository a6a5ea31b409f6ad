#include"Escrow/Msg/Shutdown.hpp"
#include"Escrow/Shutdown.hpp"
#include"Escrow/Waiter.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<set>

namespace {

typedef std::function<void()> PassF;
typedef std::function<void(std::exception_ptr)> FailF;

}

namespace Escrow {

class Waiter::Impl {
private:
	bool shutting_down;

	/* One per running wait.  The watcher's data points back
	 * here, and `running` owns it until it fires or is
	 * stopped.
	 */
	struct Timer {
		ev_timer watcher;
		Impl* waiter;
		PassF pass;
		FailF fail;
	};
	std::set<Timer*> running;

	/* Takes the timer off the loop and out of `running`,
	 * handing its ownership to the caller.
	 */
	std::unique_ptr<Timer> detach(Timer* t) {
		ev_timer_stop(EV_DEFAULT_ &t->watcher);
		running.erase(t);
		return std::unique_ptr<Timer>(t);
	}

	static
	void on_expiry(EV_P_ ev_timer* watcher, int) {
		auto raw = (Timer*) watcher->data;
		auto t = raw->waiter->detach(raw);
		auto pass = std::move(t->pass);
		t = nullptr;
		pass();
	}

	void shutdown() {
		shutting_down = true;
		/* A failure handler may start another wait, which
		 * fails at once, so iterate over a copy.
		 */
		auto stopping = running;
		for (auto raw : stopping) {
			auto fail = std::move(detach(raw)->fail);
			fail(std::make_exception_ptr(Escrow::Shutdown()));
		}
	}

	void start(double seconds, PassF pass, FailF fail) {
		auto t = Util::make_unique<Timer>();
		ev_timer_init(&t->watcher, &on_expiry, seconds, 0);
		t->waiter = this;
		t->pass = std::move(pass);
		t->fail = std::move(fail);
		t->watcher.data = t.get();
		ev_timer_start(EV_DEFAULT_ &t->watcher);
		running.insert(t.release());
	}

public:
	explicit
	Impl(S::Bus& bus) : shutting_down(false) {
		bus.subscribe<Msg::Shutdown>([this](Msg::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		auto stopping = running;
		for (auto raw : stopping)
			(void) detach(raw);
	}

	Ev::Io<void> wait(double seconds) {
		if (shutting_down)
			return Ev::lift().then([]() -> Ev::Io<void> {
				throw Escrow::Shutdown();
			});
		/* A grace of zero still lets other greenthreads run.  */
		if (seconds <= 0)
			return Ev::yield();
		return Ev::Io<void>([this, seconds](PassF pass, FailF fail) {
			if (shutting_down)
				return fail(std::make_exception_ptr(
					Escrow::Shutdown()
				));
			start(seconds, std::move(pass), std::move(fail));
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}

}
