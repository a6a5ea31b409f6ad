#undef NDEBUG
#include"Harness.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<sodium/core.h>

/* Two devices approving the same pending transaction before
 * either hears of the other: the later write replaces the
 * earlier one wholesale, and the earlier approval is lost.
 */

namespace {

Escrow::KeyList approvals(Harness::Device& dev, std::string const& address) {
	return dev.registry.find(address).pending->partial_tx.approvals;
}

}

int main() {
	assert(sodium_init() >= 0);

	Escrow::Relay relay;
	Harness::FakeArk ark;
	Harness::Device a(relay, ark);
	Harness::Device b(relay, ark);

	Escrow::KeySigner seller(Harness::privkey(Harness::seller_sk));
	Escrow::KeySigner arbitrator(Harness::privkey(Harness::arbitrator_sk));
	Escrow::KeySigner server(Harness::privkey(Harness::server_sk));

	auto address = std::string();

	auto code = Ev::lift().then([&]() {
		return a.registry.start();
	}).then([&]() {
		return b.registry.start();
	}).then([&]() {
		return a.coordinator.open_contract( Harness::party(1, "Alice", 1)
						  , Harness::party(2, "Bob", 2)
						  , Harness::party(3, "Carol", 3)
						  , "a piano"
						  );
	}).then([&](Escrow::Contract c) {
		address = c.address;
		/* Opened on one device, known on both.  */
		assert(b.registry.has(address));
		assert(b.registry.find(address) == c);

		ark.pay(address, 9000);
		return a.coordinator.create(address, Escrow::Release, seller);
	}).then([&]() {
		assert(b.registry.find(address) == a.registry.find(address));

		/* Two signers outstanding; the server key is on the
		 * release leaf.
		 */
		auto c = a.registry.find(address);
		auto p = std::make_shared<Escrow::PendingTransaction>(*c.pending);
		p->partial_tx.required_signers = Escrow::KeyList{
			arbitrator.pubkey(), server.pubkey()
		};
		c.pending = p;
		return a.registry.upsert(c);
	}).then([&]() {
		assert(b.registry.find(address) == a.registry.find(address));

		relay.set_queued(true);
		return a.coordinator.approve(address, server);
	}).then([&](bool executed) {
		assert(!executed);
		return b.coordinator.approve(address, arbitrator);
	}).then([&](bool executed) {
		assert(!executed);
		assert(relay.num_queued() == 2);
		assert((approvals(a, address) == Escrow::KeyList{
			seller.pubkey(), server.pubkey()
		}));
		assert((approvals(b, address) == Escrow::KeyList{
			seller.pubkey(), arbitrator.pubkey()
		}));

		return relay.flush();
	}).then([&]() {
		relay.set_queued(false);

		/* Both converge on the later write.  */
		auto expected = Escrow::KeyList{
			seller.pubkey(), arbitrator.pubkey()
		};
		assert(approvals(a, address) == expected);
		assert(approvals(b, address) == expected);
		assert(a.registry.find(address) == b.registry.find(address));
		assert(!a.registry.find(address).pending->fully_approved());
		assert(ark.submits == 0);

		/* The lost signer can approve again, and that
		 * completes it.
		 */
		return a.coordinator.approve(address, server);
	}).then([&](bool executed) {
		assert(executed);
		assert(ark.submits == 1);
		assert(ark.submitted[0].num_signatures() == 3);
		assert(!a.registry.find(address).pending);
		assert(!b.registry.find(address).pending);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
