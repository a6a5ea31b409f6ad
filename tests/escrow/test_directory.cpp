#undef NDEBUG
#include"Harness.hpp"
#include"Escrow/Directory.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<sodium/core.h>

namespace {

std::set<std::string> first_n(std::size_t n) {
	auto rv = std::set<std::string>();
	while (rv.size() < n)
		rv.insert(Escrow::Directory::next_name(rv));
	return rv;
}

}

int main() {
	using Escrow::Directory;

	assert(sodium_init() >= 0);

	/* Names are handed out in order, then numbered.  */
	assert(Directory::next_name({}) == "Alice");
	assert(Directory::next_name({"Alice"}) == "Bob");
	assert(Directory::next_name({"Bob"}) == "Alice");
	assert(Directory::next_name({"Alice", "Bob", "Dave"}) == "Carol");
	{
		auto all = first_n(23);
		assert(all.count("Zeke") == 1);
		assert(Directory::next_name(all) == "Alice 1");
		all.insert("Alice 1");
		assert(Directory::next_name(all) == "Alice 2");
	}

	Escrow::Relay relay;
	S::Bus bus_a;
	S::Bus bus_b;
	Escrow::RelayTransport transport_a(relay);
	Escrow::RelayTransport transport_b(relay);
	Directory a(bus_a, transport_a);
	Directory b(bus_b, transport_b);

	auto code = Ev::lift().then([&]() {
		/* Someone registered before either device started.  */
		return transport_a.publish_party(Harness::party(7, "Grace", 5));
	}).then([&]() {
		return a.start();
	}).then([&]() {
		return b.start();
	}).then([&]() {
		assert(a.participants().size() == 1);
		assert(b.lookup(Harness::pubkey(7))->name == "Grace");
		assert(!b.lookup(Harness::pubkey(1)));

		return a.enroll(Harness::pubkey(1), "tark1alice");
	}).then([&](Escrow::Party p) {
		assert(p.name == "Alice");
		assert(p.pubkey == Harness::pubkey(1));
		assert(p.address == "tark1alice");
		/* Heard by the other device.  */
		assert(b.lookup(Harness::pubkey(1)));
		assert(*b.lookup(Harness::pubkey(1)) == p);

		return b.enroll(Harness::pubkey(2), "tark1bob");
	}).then([&](Escrow::Party p) {
		assert(p.name == "Bob");
		/* Enrolling again keeps the first record.  */
		return a.enroll(Harness::pubkey(1), "tark1other");
	}).then([&](Escrow::Party p) {
		assert(p.name == "Alice");
		assert(p.address == "tark1alice");
		assert(a.participants().size() == 3);
		assert(b.participants().size() == 3);

		/* Newest first; Grace was registered long ago.  */
		auto ps = b.participants();
		assert(ps.back().name == "Grace");

		return a.unenroll(Harness::pubkey(7));
	}).then([&]() {
		assert(!a.lookup(Harness::pubkey(7)));
		assert(!b.lookup(Harness::pubkey(7)));
		assert(b.participants().size() == 2);

		/* Unknown keys are ignored.  */
		return b.unenroll(Harness::pubkey(99));
	}).then([&]() {
		assert(a.participants().size() == 2);

		/* The next name nobody holds.  */
		return b.enroll(Harness::pubkey(8), "tark1third");
	}).then([&](Escrow::Party p) {
		assert(p.name == "Carol");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
