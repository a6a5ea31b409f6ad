#ifndef ESCROW_WALLET_HPP
#define ESCROW_WALLET_HPP

#include"Escrow/ArkAddress.hpp"
#include"Escrow/FundingIF.hpp"
#include"Escrow/Network.hpp"
#include"Escrow/RelativeTimelock.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Escrow { class ChainQueryIF; }
namespace Escrow { class ChainSubmitIF; }
namespace Escrow { class SignerIF; }
namespace S { class Bus; }

namespace Escrow {

/** class Escrow::Wallet
 *
 * @brief a single-key Ark wallet, used to pay escrow
 * deposits.
 *
 * @desc Its outputs commit to the two usual Ark paths:
 * the owner together with the server at any time, or the
 * owner alone once the delay has passed.
 *
 * A payment spends every unspent output of the wallet
 * through the first path and sends the whole balance to
 * the destination, so there is never change.
 * It throws Escrow::InvalidAddress for a bad destination
 * and Escrow::NoFunds for an empty wallet.
 */
class Wallet : public FundingIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Wallet() =delete;
	Wallet(Wallet const&) =delete;

	Wallet( S::Bus& bus
	      , SignerIF& owner
	      , ChainQueryIF& query
	      , ChainSubmitIF& submitter
	      , Secp256k1::XonlyPubKey server
	      , RelativeTimelock delay
	      , Network network
	      );
	~Wallet();

	ArkAddress address() const;

	/* Sum of the unspent outputs.  */
	Ev::Io<std::uint64_t> balance();

	Ev::Io<std::string> send_to_address(std::string address) override;

	/* Where a wallet owned by the key receives.  */
	static ArkAddress address_of( Secp256k1::XonlyPubKey const& owner
				    , Secp256k1::XonlyPubKey const& server
				    , RelativeTimelock const& delay
				    , Network network
				    );
};

}

#endif /* !defined(ESCROW_WALLET_HPP) */
