#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/yield.hpp"
#include<functional>
#include<queue>
#include<utility>

namespace Ev {

class Semaphore::Impl {
private:
	std::size_t remaining;

	struct Process {
		Ev::Io<void> action;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::queue<Process> blocked;

	void unblock() {
		if (blocked.empty()) {
			++remaining;
			return;
		}
		auto next = std::move(blocked.front());
		blocked.pop();
		handle(std::move(next));
	}
	void handle(Process p) {
		auto pass = std::move(p.pass);
		auto fail = std::move(p.fail);
		p.action.run([this, pass]() {
			unblock();
			pass();
		}, [this, fail](std::exception_ptr ep) {
			unblock();
			fail(ep);
		});
	}

public:
	explicit
	Impl(std::size_t max) : remaining(max) { }

	Ev::Io<void> run(Ev::Io<void> action) {
		return Ev::Io<void>([ this, action
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			auto p = Process{action, std::move(pass), std::move(fail)};
			if (remaining > 0) {
				--remaining;
				handle(std::move(p));
			} else {
				blocked.push(std::move(p));
			}
		});
	}
};

Semaphore::Semaphore(Semaphore&&) =default;
Semaphore::~Semaphore() =default;

Semaphore::Semaphore(std::size_t max)
	: pimpl(Util::make_unique<Impl>(max)) { }

Ev::Io<void> Semaphore::core_run(Ev::Io<void> action) {
	/* Yield on entry and on exit, so a waiter queued behind
	 * us gets its turn before we continue.
	 */
	auto entered = Ev::yield().then([action]() {
		return action;
	});
	return pimpl->run(entered).then([]() {
		return Ev::yield();
	});
}

}
