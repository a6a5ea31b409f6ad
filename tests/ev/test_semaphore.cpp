#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>

namespace {

/* A read-modify-write that yields between reading and
 * writing, as an approval does while it signs.
 */
Ev::Io<void> bump(std::shared_ptr<int> counter) {
	return Ev::lift().then([counter]() {
		auto seen = *counter;
		return Ev::yield(5).then([counter, seen]() {
			*counter = seen + 1;
			return Ev::lift();
		});
	});
}

Ev::Io<void> launch( Ev::Semaphore& lock
		   , std::shared_ptr<int> counter
		   , std::shared_ptr<int> done
		   , int n
		   ) {
	if (n == 0)
		return Ev::lift();
	auto act = lock.run(bump(counter)).then([done]() {
		++*done;
		return Ev::lift();
	});
	return Ev::concurrent(act).then([&lock, counter, done, n]() {
		return launch(lock, counter, done, n - 1);
	});
}

Ev::Io<void> wait_for(std::shared_ptr<int> done, int n) {
	return Ev::yield().then([done, n]() {
		if (*done < n)
			return wait_for(done, n);
		return Ev::lift();
	});
}

}

int main() {
	auto const n = 50;

	Ev::Semaphore lock(1);
	Ev::Semaphore unlocked(n);
	auto locked_count = std::make_shared<int>(0);
	auto locked_done = std::make_shared<int>(0);
	auto racy_count = std::make_shared<int>(0);
	auto racy_done = std::make_shared<int>(0);

	auto code = Ev::lift().then([&]() {
		return launch(lock, locked_count, locked_done, n);
	}).then([&]() {
		return launch(unlocked, racy_count, racy_done, n);
	}).then([&]() {
		return wait_for(locked_done, n);
	}).then([&]() {
		return wait_for(racy_done, n);
	}).then([&]() {
		/* Under the lock, no update is lost.  */
		assert(*locked_count == n);
		/* Without it, updates overwrite each other.  */
		assert(*racy_count < n);

		/* A failed action releases the lock.  */
		return lock.run(Ev::lift().then([]() {
			throw std::runtime_error("failed");
			return Ev::lift(0);
		})).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(-1);
		});
	}).then([&](int r) {
		assert(r == -1);
		return lock.run(Ev::lift(std::string("again")));
	}).then([&](std::string s) {
		assert(s == "again");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
