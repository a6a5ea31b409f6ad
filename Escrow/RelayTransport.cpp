#include"Escrow/Contract.hpp"
#include"Escrow/ContractCodec.hpp"
#include"Escrow/Relay.hpp"
#include"Escrow/RelayTransport.hpp"
#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/make_unique.hpp"

namespace {

/* Runs the handlers one after the other.  */
template<typename H, typename F>
Ev::Io<void> run_all( std::shared_ptr<std::vector<H>> hs
		    , std::size_t i
		    , F call
		    ) {
	if (i >= hs->size())
		return Ev::lift();
	return call((*hs)[i]).then([hs, i, call]() {
		return run_all(hs, i + 1, call);
	});
}

}

namespace Escrow {

class RelayTransport::Impl {
public:
	Relay& relay;
	std::vector<ContractsHandler> on_contracts;
	std::vector<PartiesHandler> on_parties;
	std::vector<PendingHandler> on_pending;

	explicit
	Impl(Relay& relay_) : relay(relay_) {
		relay.listen([this]( Relay::Channel c
				   , std::string const& payload
				   ) {
			return receive(c, payload);
		});
	}

	Ev::Io<void> receive(Relay::Channel c, std::string const& payload) {
		auto js = Jsmn::Object::parse_json(payload);
		switch (c) {
		case Relay::Contracts: {
			auto cs = std::make_shared<std::vector<Contract>>(
				ContractCodec::decode_contracts(js)
			);
			auto hs = std::make_shared<std::vector<ContractsHandler>>(
				on_contracts
			);
			return run_all(hs, 0, [cs](ContractsHandler const& h) {
				return h(*cs);
			});
		}
		case Relay::Parties: {
			auto ps = std::make_shared<std::vector<Party>>(
				ContractCodec::decode_parties(js)
			);
			auto hs = std::make_shared<std::vector<PartiesHandler>>(
				on_parties
			);
			return run_all(hs, 0, [ps](PartiesHandler const& h) {
				return h(*ps);
			});
		}
		case Relay::PendingTransactions: {
			auto address = std::make_shared<std::string>(
				js["address"]
			);
			auto pt = std::make_shared<PendingTransaction>(
				ContractCodec::decode_pending_transaction(
					js["transaction"]
				)
			);
			auto hs = std::make_shared<std::vector<PendingHandler>>(
				on_pending
			);
			return run_all(hs, 0, [address, pt](PendingHandler const& h) {
				return h(*address, *pt);
			});
		}
		}
		return Ev::lift();
	}
};

RelayTransport::RelayTransport(Relay& relay)
	: pimpl(Util::make_unique<Impl>(relay)) { }
RelayTransport::~RelayTransport() { }

Ev::Io<void> RelayTransport::publish_contract(Contract const& c) {
	return pimpl->relay.put( Relay::Contracts
			       , c.address
			       , ContractCodec::to_json(c)
			       );
}
void RelayTransport::subscribe_contracts(ContractsHandler h) {
	pimpl->on_contracts.push_back(std::move(h));
}
Ev::Io<std::vector<Contract>> RelayTransport::get_contracts() {
	auto js = Jsmn::Object::parse_json(
		pimpl->relay.snapshot(Relay::Contracts)
	);
	return Ev::lift(ContractCodec::decode_contracts(js));
}

Ev::Io<void> RelayTransport::publish_party(Party const& p) {
	return pimpl->relay.put( Relay::Parties
			       , std::string(p.pubkey)
			       , ContractCodec::encode(p).output()
			       );
}
Ev::Io<void>
RelayTransport::unpublish_party(Secp256k1::XonlyPubKey const& k) {
	return pimpl->relay.erase(Relay::Parties, std::string(k));
}
void RelayTransport::subscribe_parties(PartiesHandler h) {
	pimpl->on_parties.push_back(std::move(h));
}
Ev::Io<std::vector<Party>> RelayTransport::get_parties() {
	auto js = Jsmn::Object::parse_json(
		pimpl->relay.snapshot(Relay::Parties)
	);
	return Ev::lift(ContractCodec::decode_parties(js));
}

Ev::Io<void>
RelayTransport::notify_pending_transaction( std::string const& address
					  , PendingTransaction const& pt
					  ) {
	auto js = Json::Out()
		.start_object()
			.field("address", address)
			.field("transaction", ContractCodec::encode(pt))
		.end_object()
		;
	return pimpl->relay.announce(Relay::PendingTransactions, js.output());
}
void RelayTransport::subscribe_pending_transactions(PendingHandler h) {
	pimpl->on_pending.push_back(std::move(h));
}

}
