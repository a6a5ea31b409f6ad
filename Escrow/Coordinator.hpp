#ifndef ESCROW_COORDINATOR_HPP
#define ESCROW_COORDINATOR_HPP

#include"Escrow/Action.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/EscrowState.hpp"
#include"Escrow/Network.hpp"
#include"Escrow/RelativeTimelock.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include<memory>
#include<string>

namespace Escrow { class ChainQueryIF; }
namespace Escrow { class ChainSubmitIF; }
namespace Escrow { class ContractRegistry; }
namespace Escrow { class FundingIF; }
namespace Escrow { class SignerIF; }
namespace Escrow { class TransportIF; }
namespace Escrow { class Waiter; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Escrow {

/* What every contract this coordinator handles shares.  */
struct CoordinatorSettings {
	Secp256k1::XonlyPubKey server;
	RelativeTimelock unilateral_delay;
	Network network;
	/* Seconds a rejected transaction stays visible.  */
	double reject_grace;
};

/** class Escrow::Coordinator
 *
 * @brief drives the one pending spend each contract may
 * have, from proposal through co-signing to submission.
 *
 * @desc Every operation runs under the registry's
 * exclusive lock for the contract, and builds the new
 * record as a copy that is only upserted once every
 * step before it has succeeded.
 *
 * Errors are those of `Escrow/Error.hpp`, raised through
 * the returned `Ev::Io`.
 */
class Coordinator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Coordinator() =delete;
	Coordinator(Coordinator const&) =delete;

	Coordinator( S::Bus& bus
		   , ContractRegistry& registry
		   , TransportIF& transport
		   , ChainQueryIF& query
		   , ChainSubmitIF& submitter
		   , FundingIF& funding
		   , Waiter& waiter
		   , CoordinatorSettings settings
		   );
	~Coordinator();

	/* Derives the address and stores the new contract.  */
	Ev::Io<Contract> open_contract( Party buyer
				      , Party seller
				      , Party arbitrator
				      , std::string description
				      );

	/** Escrow::Coordinator::create
	 *
	 * @brief starts the given action on a contract.
	 *
	 * @desc `Fund` pays into the contract address from the
	 * initiator's wallet and stops there.
	 * Every other action builds a spend of the contract's
	 * output, signs it as the initiator, and stores it as
	 * the pending transaction for the other required
	 * signers.
	 */
	Ev::Io<void> create( std::string address
			   , Action action
			   , SignerIF& initiator
			   );

	/** Escrow::Coordinator::approve
	 *
	 * @brief adds the signer's signatures and approval.
	 *
	 * @desc Once everyone has approved, the spend is
	 * submitted and finalized, and the pending transaction
	 * is cleared.
	 * If that fails the approved transaction stays and the
	 * error is a NetworkError; `execute` retries it.
	 * Returns true if the spend was executed.
	 */
	Ev::Io<bool> approve(std::string address, SignerIF& signer);

	/* Submits and finalizes a fully approved pending
	 * transaction, giving the Ark transaction id.
	 */
	Ev::Io<std::string> execute(std::string address);

	/* Marks the pending transaction rejected, then clears
	 * it once the grace period is over.
	 */
	Ev::Io<void> reject( std::string address
			   , Secp256k1::XonlyPubKey signer
			   );

	Ev::Io<EscrowState> escrow_state(std::string address);

	/* The contract's scripts under our server key and delay.  */
	Script script(Contract const&) const;
};

}

#endif /* !defined(ESCROW_COORDINATOR_HPP) */
