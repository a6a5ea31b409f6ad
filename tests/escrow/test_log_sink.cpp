#undef NDEBUG
#include"Escrow/LogSink.hpp"
#include"Escrow/log.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<sstream>
#include<string>
#include<vector>

namespace {

std::vector<std::string> lines(std::string const& s) {
	auto rv = std::vector<std::string>();
	auto is = std::istringstream(s);
	auto l = std::string();
	while (std::getline(is, l))
		rv.push_back(l);
	return rv;
}

}

int main() {
	auto lvl = Escrow::LogLevel();
	assert(Escrow::parse_log_level(" WARNING ", lvl));
	assert(lvl == Escrow::Warn);
	assert(!Escrow::parse_log_level("verbose", lvl));
	assert(Escrow::to_string(Escrow::Trace) == "trace");

	S::Bus bus;
	auto out = std::ostringstream();
	Escrow::LogSink sink(bus, Escrow::Info, out);

	auto code = Ev::lift().then([&]() {
		return Escrow::log(bus, Escrow::Debug, "hidden %d", 1);
	}).then([&]() {
		return Escrow::log(bus, Escrow::Info, "shown %s", "two");
	}).then([&]() {
		return Escrow::log(bus, Escrow::Error, "quote \" and\nnewline");
	}).then([&]() {
		sink.set_threshold(Escrow::Trace);
		return Escrow::log(bus, Escrow::Trace, "now %zu", std::size_t(3));
	}).then([&]() {
		auto ls = lines(out.str());
		assert(ls.size() == 3);

		auto first = Jsmn::Object::parse_json(ls[0]);
		assert(std::string(first["level"]) == "info");
		assert(std::string(first["message"]) == "shown two");
		assert(first["time"].is_number());

		/* One line per message, whatever it contains.  */
		auto second = Jsmn::Object::parse_json(ls[1]);
		assert(std::string(second["level"]) == "error");
		assert(std::string(second["message"]) == "quote \" and\nnewline");

		auto third = Jsmn::Object::parse_json(ls[2]);
		assert(std::string(third["message"]) == "now 3");

		return Ev::lift(0);
	});

	return Ev::start(code);
}
