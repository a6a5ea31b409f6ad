#ifndef ESCROW_TRANSPORTIF_HPP
#define ESCROW_TRANSPORTIF_HPP

#include<functional>
#include<string>
#include<vector>

namespace Escrow { struct Contract; }
namespace Escrow { struct Party; }
namespace Escrow { struct PendingTransaction; }
namespace Ev { template<typename a> class Io; }
namespace Secp256k1 { class XonlyPubKey; }

namespace Escrow {

/** class Escrow::TransportIF
 *
 * @brief shares contracts and participants between devices.
 *
 * @desc Delivery is at-least-once and unordered.
 * Subscribers get the whole current set each time anything
 * in it changes.
 * A published contract replaces any other with the same
 * address; there is no merging of concurrent edits.
 */
class TransportIF {
public:
	typedef std::function<Ev::Io<void>(std::vector<Contract> const&)>
		ContractsHandler;
	typedef std::function<Ev::Io<void>(std::vector<Party> const&)>
		PartiesHandler;
	typedef std::function<Ev::Io<void>( std::string const&
					  , PendingTransaction const&
					  )>
		PendingHandler;

	virtual ~TransportIF() { }

	virtual Ev::Io<void> publish_contract(Contract const&) =0;
	virtual void subscribe_contracts(ContractsHandler) =0;
	virtual Ev::Io<std::vector<Contract>> get_contracts() =0;

	virtual Ev::Io<void> publish_party(Party const&) =0;
	virtual Ev::Io<void> unpublish_party(Secp256k1::XonlyPubKey const&) =0;
	virtual void subscribe_parties(PartiesHandler) =0;
	virtual Ev::Io<std::vector<Party>> get_parties() =0;

	/* Tells the other parties of a contract that their
	 * signature is wanted.
	 */
	virtual
	Ev::Io<void>
	notify_pending_transaction( std::string const& address
				  , PendingTransaction const&
				  ) =0;
	virtual void subscribe_pending_transactions(PendingHandler) =0;
};

}

#endif /* !defined(ESCROW_TRANSPORTIF_HPP) */
