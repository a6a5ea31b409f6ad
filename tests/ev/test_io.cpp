#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

namespace {

class Refused : public std::runtime_error {
public:
	Refused() : std::runtime_error("refused") { }
};

}

int main() {
	auto background_ran = false;
	auto steps = std::string();

	auto code = Ev::yield().then([&]() {
		/* A concurrent action starts only once we yield.  */
		return Ev::concurrent(Ev::yield().then([&]() {
			background_ran = true;
			return Ev::lift();
		}));
	}).then([&]() {
		assert(!background_ran);
		return Ev::yield(3);
	}).then([&]() {
		assert(background_ran);

		/* A throw inside `then` skips what follows.  */
		return Ev::lift().then([&]() {
			steps += "a";
			throw Refused();
			return Ev::lift(std::string("unreached"));
		}).then([&](std::string s) {
			steps += s;
			return Ev::lift(s);
		}).catching<std::runtime_error>([&](std::runtime_error const& e) {
			steps += "c";
			return Ev::lift(std::string(e.what()));
		});
	}).then([&](std::string what) {
		assert(what == "refused");
		assert(steps == "ac");

		/* Handlers for other types let it pass.  */
		return Ev::fail<int>(Refused())
			.catching<std::logic_error>([](std::logic_error const&) {
			return Ev::lift(1);
		}).catching<Refused>([](Refused const&) {
			return Ev::lift(2);
		});
	}).then([&](int n) {
		assert(n == 2);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
