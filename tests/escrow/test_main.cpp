#undef NDEBUG
#include"Escrow/Main.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Harness.hpp"
#include<assert.h>
#include<sstream>
#include<string>

namespace {

struct Run {
	int code;
	std::string out;
	std::string err;
};

/* Offline: the server key is given, and the store is in memory.  */
std::vector<std::string> offline(std::vector<std::string> args) {
	auto rv = std::vector<std::string>{
		"vescrow",
		"--network=regtest",
		"--db=:memory:",
		"--ark-url=http://127.0.0.1:1",
		"--log-level=error",
		"--server-pubkey=" + std::string(Harness::pubkey(Harness::server_sk))
	};
	rv.insert(rv.end(), args.begin(), args.end());
	return rv;
}

Ev::Io<Run> run(std::vector<std::string> argv) {
	auto out = std::make_shared<std::ostringstream>();
	auto err = std::make_shared<std::ostringstream>();
	auto m = std::make_shared<Escrow::Main>(std::move(argv), *out, *err);
	return m->run().then([m, out, err](int code) {
		return Ev::lift(Run{code, out->str(), err->str()});
	});
}

bool has(std::string const& s, std::string const& part) {
	return s.find(part) != std::string::npos;
}

std::string const buyer_key = std::string(Harness::privkey(Harness::buyer_sk));

}

int main() {
	auto seller = std::string(Harness::pubkey(Harness::seller_sk));
	auto arbiter = std::string(Harness::pubkey(Harness::arbitrator_sk));

	auto code = Ev::lift().then([]() {
		return run({"vescrow", "--version"});
	}).then([](Run r) {
		assert(r.code == 0);
		assert(has(r.out, "vescrow "));

		return run(offline({"frobnicate"}));
	}).then([](Run r) {
		assert(r.code == 1);
		assert(has(r.err, "unknown command: frobnicate"));

		/* Signing commands refuse to run without a key.  */
		return run(offline({"create", "tark1xyz", "release"}));
	}).then([](Run r) {
		assert(r.code == 1);
		assert(has(r.err, "create needs --key"));
		assert(r.out.empty());

		return run(offline({"approve", "tark1xyz"}));
	}).then([](Run r) {
		assert(r.code == 1);
		assert(has(r.err, "approve needs --key"));

		return run(offline({"--key=" + buyer_key, "create", "tark1xyz", "sideways"}));
	}).then([](Run r) {
		assert(r.code == 1);
		assert(has(r.err, "unknown action: sideways"));

		return run(offline({"--key=" + buyer_key, "open", "zz", "zz", "bike"}));
	}).then([](Run r) {
		assert(r.code == 1);
		assert(has(r.err, "bad seller key"));

		return run(offline({"--key=" + buyer_key, "open", "bike"}));
	}).then([seller, arbiter](Run r) {
		assert(r.code == 1);
		assert(has(r.err, "open needs SELLER ARBITER TEXT"));

		/* Opening needs neither the server nor the relay.  */
		return run(offline({ "--key=" + buyer_key
				   , "open", seller, arbiter, "a used bike"
				   }));
	}).then([seller](Run r) {
		assert(r.code == 0);
		assert(r.err.empty());
		assert(has(r.out, "\"address\":\"tark1"));
		assert(has(r.out, "Alice"));
		assert(has(r.out, "Bob"));
		assert(has(r.out, "Carol"));
		assert(has(r.out, seller));
		assert(has(r.out, "a used bike"));
		assert(r.out.find("Alice") < r.out.find("Bob"));

		/* The store is gone with the process.  */
		return run(offline({"--key=" + buyer_key, "execute", "tark1xyz"}));
	}).then([](Run r) {
		assert(r.code == 1);
		assert(!r.err.empty());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
