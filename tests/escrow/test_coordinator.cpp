#undef NDEBUG
#include"Harness.hpp"
#include"Escrow/EscrowState.hpp"
#include"Escrow/OffchainTx.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<sodium/core.h>

using Harness::throws;

namespace {

Escrow::Contract with_required( Escrow::Contract c
			      , Escrow::KeyList required
			      ) {
	auto p = std::make_shared<Escrow::PendingTransaction>(*c.pending);
	p->partial_tx.required_signers = std::move(required);
	c.pending = p;
	return c;
}

}

int main() {
	assert(sodium_init() >= 0);

	Escrow::Relay relay;
	Harness::FakeArk ark;
	Harness::Device dev(relay, ark);
	auto& coord = dev.coordinator;

	Escrow::KeySigner buyer(Harness::privkey(Harness::buyer_sk));
	Escrow::KeySigner seller(Harness::privkey(Harness::seller_sk));
	Escrow::KeySigner arbitrator(Harness::privkey(Harness::arbitrator_sk));
	Escrow::KeySigner server(Harness::privkey(Harness::server_sk));
	Escrow::KeySigner outsider(Harness::privkey(9));

	auto alice = Harness::party(Harness::buyer_sk, "Alice", 1);
	auto bob = Harness::party(Harness::seller_sk, "Bob", 2);
	auto carol = Harness::party(Harness::arbitrator_sk, "Carol", 3);
	auto dave = Harness::party(5, "Dave", 4);

	auto address = std::string();
	auto address2 = std::string();
	auto address3 = std::string();

	auto code = Ev::lift().then([&]() {
		return dev.registry.start();
	}).then([&]() {
		return coord.open_contract(alice, bob, carol, "a bicycle");
	}).then([&](Escrow::Contract c) {
		address = c.address;
		assert(address.substr(0, 5) == "tark1");
		assert(!c.pending);
		assert(c.buyer == alice);
		assert(dev.registry.has(address));
		assert( Escrow::ArkAddress::decode(address).pk_script()
		     == coord.script(c).pk_script()
		      );

		/* The same parties give the same contract back.  */
		return coord.open_contract(alice, bob, carol, "a unicycle");
	}).then([&](Escrow::Contract c) {
		assert(c.address == address);
		assert(c.description == "a bicycle");
		assert(dev.registry.contracts().size() == 1);
		assert(dev.registry.contracts_for(carol.pubkey).size() == 1);
		assert(dev.registry.contracts_for(dave.pubkey).empty());

		return coord.escrow_state(address);
	}).then([&](Escrow::EscrowState s) {
		assert(s.status == Escrow::Created);
		assert(s.balance == 0);
		assert(!s.vtxo_exists);
		assert(( Escrow::available_actions(s, Escrow::Buyer)
		      == std::vector<std::string>{"Fund"}
		       ));

		/* Nothing to spend yet.  */
		return throws<Escrow::NoFunds>(
			coord.create(address, Escrow::Release, seller)
		);
	}).then([&](bool t) {
		assert(t);
		/* Only the buyer funds.  */
		return throws<Escrow::NotAuthorized>(
			coord.create(address, Escrow::Fund, seller)
		);
	}).then([&](bool t) {
		assert(t);
		assert(ark.funded.empty());
		return throws<Escrow::NotAuthorized>(
			coord.create(address, Escrow::Fund, outsider)
		);
	}).then([&](bool t) {
		assert(t);
		return throws<Escrow::UnknownContract>(
			coord.create("tark1nothing", Escrow::Fund, buyer)
		);
	}).then([&](bool t) {
		assert(t);
		return coord.create(address, Escrow::Fund, buyer);
	}).then([&]() {
		/* Funding is a plain transfer.  */
		assert(ark.funded.size() == 1);
		assert(ark.funded[0] == address);
		assert(!dev.registry.find(address).pending);
		return throws<Escrow::AlreadyFunded>(
			coord.create(address, Escrow::Fund, buyer)
		);
	}).then([&](bool t) {
		assert(t);
		return coord.escrow_state(address);
	}).then([&](Escrow::EscrowState s) {
		assert(s.status == Escrow::Funded);
		assert(s.balance == ark.fund_amount);

		/* The buyer may not release.  */
		return throws<Escrow::NotAuthorized>(
			coord.create(address, Escrow::Release, buyer)
		);
	}).then([&](bool t) {
		assert(t);
		assert(!dev.registry.find(address).pending);
		return coord.create(address, Escrow::Release, seller);
	}).then([&]() {
		auto c = dev.registry.find(address);
		assert(c.pending);
		auto const& p = *c.pending;
		assert(p.action == Escrow::Release);
		assert(p.initiator == seller.pubkey());
		assert(p.status == Escrow::PendingCosign);
		assert(p.partial_tx.required_signers == Escrow::KeyList{arbitrator.pubkey()});
		assert(p.partial_tx.approvals == Escrow::KeyList{seller.pubkey()});
		assert(p.partial_tx.rejections.empty());
		assert(p.partial_tx.vtxo.value == ark.fund_amount);
		assert(p.partial_tx.spend_tx.num_signatures() == 1);
		assert(p.partial_tx.checkpoint_txs.size() == 1);
		assert(p.partial_tx.checkpoint_txs[0].num_signatures() == 1);
		assert(!p.fully_approved());
		/* Nothing goes to the server before everyone signs.  */
		assert(ark.submits == 0);

		/* One pending transaction per contract.  */
		return throws<Escrow::PendingTransactionExists>(
			coord.create(address, Escrow::Refund, arbitrator)
		);
	}).then([&](bool t) {
		assert(t);
		return throws<Escrow::NotRequired>(coord.approve(address, buyer));
	}).then([&](bool t) {
		assert(t);
		/* The initiator already signed and is not asked again.  */
		return throws<Escrow::NotRequired>(coord.approve(address, seller));
	}).then([&](bool t) {
		assert(t);
		return throws<Escrow::AwaitingSignatures>(coord.execute(address));
	}).then([&](bool t) {
		assert(t);
		return coord.approve(address, arbitrator);
	}).then([&](bool executed) {
		assert(executed);
		assert(ark.submits == 1);
		assert(ark.finalizes == 1);

		/* Everything goes to the seller.  */
		auto const& sent = ark.submitted[0];
		assert(sent.num_signatures() == 2);
		assert(sent.tx.outputs.size() == 2);
		assert(sent.tx.outputs[0].amount == ark.fund_amount);
		assert(sent.tx.outputs[0].scriptPubKey == Harness::payout_script(Harness::seller_sk));
		assert(sent.tx.outputs[1] == Escrow::anchor_output());

		assert(!dev.registry.find(address).pending);
		return throws<Escrow::NoPendingTransaction>(
			coord.approve(address, arbitrator)
		);
	}).then([&](bool t) {
		assert(t);
		return throws<Escrow::NoPendingTransaction>(coord.execute(address));
	}).then([&](bool t) {
		assert(t);
		return coord.escrow_state(address);
	}).then([&](Escrow::EscrowState s) {
		assert(s.status == Escrow::Executed);
		assert(s.balance == 0);
		assert(s.vtxo_exists);

		/* Direct settlement of an odd amount.  */
		return coord.open_contract(alice, bob, dave, "odd change");
	}).then([&](Escrow::Contract c) {
		address2 = c.address;
		assert(address2 != address);
		ark.pay(address2, 101);
		return coord.create(address2, Escrow::DirectSettle, buyer);
	}).then([&]() {
		auto c = dev.registry.find(address2);
		assert(c.pending->partial_tx.required_signers == Escrow::KeyList{seller.pubkey()});
		return coord.approve(address2, seller);
	}).then([&](bool executed) {
		assert(executed);
		assert(ark.submits == 2);
		auto const& sent = ark.submitted[1];
		assert(sent.tx.outputs.size() == 3);
		assert(sent.tx.outputs[0].amount == 50);
		assert(sent.tx.outputs[0].scriptPubKey == Harness::payout_script(Harness::buyer_sk));
		assert(sent.tx.outputs[1].amount == 51);
		assert(sent.tx.outputs[1].scriptPubKey == Harness::payout_script(Harness::seller_sk));
		assert(sent.tx.outputs[2].amount == 0);

		/* Two outstanding signers, approving in either order,
		 * execute exactly once.
		 */
		return coord.open_contract(bob, alice, carol, "roles swapped");
	}).then([&](Escrow::Contract c) {
		address3 = c.address;
		ark.pay(address3, 7000);
		/* Bob is the buyer here, Alice the seller.  */
		return coord.create(address3, Escrow::Release, buyer);
	}).then([&]() {
		/* The server key is on the release leaf too, so it can
		 * stand as a second outstanding signer.
		 */
		auto c = with_required( dev.registry.find(address3)
				      , { server.pubkey(), arbitrator.pubkey() }
				      );
		return dev.registry.upsert(c);
	}).then([&]() {
		return coord.approve(address3, server);
	}).then([&](bool executed) {
		assert(!executed);
		assert(ark.submits == 2);

		/* A second approval by the same signer changes nothing.  */
		return throws<Escrow::AlreadyApproved>(coord.approve(address3, server));
	}).then([&](bool t) {
		assert(t);
		auto const& p = *dev.registry.find(address3).pending;
		assert(p.partial_tx.approvals.size() == 2);
		assert(p.partial_tx.approvals[1] == server.pubkey());
		assert(p.status == Escrow::PendingCosign);
		return coord.approve(address3, arbitrator);
	}).then([&](bool executed) {
		assert(executed);
		assert(ark.submits == 3);
		assert(ark.finalizes == 3);
		assert(ark.submitted[2].num_signatures() == 3);
		assert(!dev.registry.find(address3).pending);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
