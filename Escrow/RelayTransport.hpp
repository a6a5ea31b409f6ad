#ifndef ESCROW_RELAYTRANSPORT_HPP
#define ESCROW_RELAYTRANSPORT_HPP

#include"Escrow/TransportIF.hpp"
#include<memory>

namespace Escrow { class Relay; }

namespace Escrow {

/** class Escrow::RelayTransport
 *
 * @brief one device's connection to an `Escrow::Relay`.
 *
 * @desc Everything crosses the relay as JSON text in the
 * wire form of `Escrow::ContractCodec`, so each device
 * decodes its own copy.
 */
class RelayTransport : public TransportIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	RelayTransport() =delete;
	RelayTransport(RelayTransport const&) =delete;

	explicit
	RelayTransport(Relay& relay);
	~RelayTransport();

	Ev::Io<void> publish_contract(Contract const&) override;
	void subscribe_contracts(ContractsHandler) override;
	Ev::Io<std::vector<Contract>> get_contracts() override;

	Ev::Io<void> publish_party(Party const&) override;
	Ev::Io<void> unpublish_party(Secp256k1::XonlyPubKey const&) override;
	void subscribe_parties(PartiesHandler) override;
	Ev::Io<std::vector<Party>> get_parties() override;

	Ev::Io<void>
	notify_pending_transaction( std::string const& address
				  , PendingTransaction const&
				  ) override;
	void subscribe_pending_transactions(PendingHandler) override;
};

}

#endif /* !defined(ESCROW_RELAYTRANSPORT_HPP) */
