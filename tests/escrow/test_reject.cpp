#undef NDEBUG
#include"Harness.hpp"
#include"Escrow/Msg/Shutdown.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<sodium/core.h>

using Harness::throws;

int main() {
	assert(sodium_init() >= 0);

	Escrow::Relay relay;
	Harness::FakeArk ark;
	Harness::Device dev(relay, ark, Sqlite3::Db(), 0.05);
	auto& coord = dev.coordinator;
	/* Another device, slow to clear its rejections.  */
	Harness::Device other(relay, ark, Sqlite3::Db(), 30);

	Escrow::KeySigner buyer(Harness::privkey(Harness::buyer_sk));
	Escrow::KeySigner seller(Harness::privkey(Harness::seller_sk));
	auto arbitrator = Harness::pubkey(Harness::arbitrator_sk);

	auto address = std::string();

	auto code = Ev::lift().then([&]() {
		return dev.registry.start();
	}).then([&]() {
		return other.registry.start();
	}).then([&]() {
		return coord.open_contract( Harness::party(1, "Alice", 1)
					  , Harness::party(2, "Bob", 2)
					  , Harness::party(3, "Carol", 3)
					  , "a violin"
					  );
	}).then([&](Escrow::Contract c) {
		address = c.address;
		ark.pay(address, 2500);
		return coord.create(address, Escrow::Refund, buyer);
	}).then([&]() {
		/* Only the arbitrator is asked.  */
		return throws<Escrow::NotRequired>(coord.reject(address, seller.pubkey()));
	}).then([&](bool t) {
		assert(t);
		return throws<Escrow::NotRequired>(coord.reject(address, buyer.pubkey()));
	}).then([&](bool t) {
		assert(t);
		return coord.reject(address, arbitrator);
	}).then([&]() {
		/* Still visible, as rejected.  */
		auto c = dev.registry.find(address);
		assert(c.pending);
		assert(c.pending->status == Escrow::Rejected);
		assert(( c.pending->partial_tx.rejections
		      == Escrow::KeyList{arbitrator}
		       ));
		assert(c.pending->partial_tx.approvals.size() == 1);

		return throws<Escrow::AlreadyRejected>(coord.reject(address, arbitrator));
	}).then([&](bool t) {
		assert(t);
		/* Neither executable nor open to a new proposal.  */
		return throws<Escrow::NotPending>(coord.execute(address));
	}).then([&](bool t) {
		assert(t);
		return throws<Escrow::PendingTransactionExists>(
			coord.create(address, Escrow::DirectSettle, seller)
		);
	}).then([&](bool t) {
		assert(t);

		/* The grace period passes.  */
		return dev.waiter.wait(0.2);
	}).then([&]() {
		assert(!dev.registry.find(address).pending);
		assert(ark.submits == 0);

		/* The output is untouched; a new proposal may start.  */
		return coord.create(address, Escrow::DirectSettle, seller);
	}).then([&]() {
		auto c = dev.registry.find(address);
		assert(c.pending);
		assert(c.pending->action == Escrow::DirectSettle);
		assert(c.pending->status == Escrow::PendingCosign);

		return other.coordinator.reject(address, buyer.pubkey());
	}).then([&]() {
		assert(dev.registry.find(address).pending->status == Escrow::Rejected);
		/* The rejecting device holds it for its grace period.  */
		return throws<Escrow::PendingTransactionExists>(
			other.coordinator.create(address, Escrow::Release, seller)
		);
	}).then([&](bool t) {
		assert(t);
		/* Here nothing is waiting on it, so it gives way.  */
		return coord.create(address, Escrow::Release, seller);
	}).then([&]() {
		auto c = other.registry.find(address);
		assert(c.pending->action == Escrow::Release);
		assert(c.pending->status == Escrow::PendingCosign);

		/* Ends the slow grace period.  */
		return other.bus.raise(Escrow::Msg::Shutdown{});
	}).then([&]() {
		return dev.waiter.wait(0.05);
	}).then([&]() {
		/* The cut-short clearing left the new proposal alone.  */
		assert(other.registry.find(address).pending->action == Escrow::Release);
		return throws<Escrow::PendingTransactionExists>(
			other.coordinator.create(address, Escrow::Refund, buyer)
		);
	}).then([&](bool t) {
		assert(t);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
