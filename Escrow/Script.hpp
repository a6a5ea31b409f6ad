#ifndef ESCROW_SCRIPT_HPP
#define ESCROW_SCRIPT_HPP

#include"Escrow/Action.hpp"
#include"Escrow/ArkAddress.hpp"
#include"Escrow/Network.hpp"
#include"Escrow/RelativeTimelock.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Escrow {

/** struct Escrow::EscrowOptions
 *
 * @brief the four parties of an escrow and the delay
 * after which the unilateral paths open.
 *
 * @desc Keys are raw bytes so that a bad length can be
 * reported with the role it belongs to.
 */
struct EscrowOptions {
	std::vector<std::uint8_t> buyer;
	std::vector<std::uint8_t> seller;
	std::vector<std::uint8_t> arbitrator;
	std::vector<std::uint8_t> server;
	RelativeTimelock unilateral_delay;
};

/* A committed leaf, with what is needed to spend through it.  */
struct TapLeaf {
	std::vector<std::uint8_t> script;
	std::uint8_t leaf_version;
	std::vector<std::uint8_t> control_block;
};

/** class Escrow::Script
 *
 * @brief the six-path escrow tapscript and the taproot
 * output that commits to it.
 *
 * @desc Everything is derived in the constructor, so the
 * address is a pure function of the four keys and the
 * delay.
 * Construction throws Escrow::InvalidKeyLength,
 * Escrow::DuplicateKey, Secp256k1::InvalidPubKey or
 * Escrow::InvalidTimelock, and nothing else.
 */
class Script {
public:
	/* In commitment order.  */
	enum Path
	{ Release
	, Refund
	, Direct
	, UnilateralRelease
	, UnilateralRefund
	, UnilateralDirect
	};
	static std::size_t const num_paths = 6;

	struct PathInfo {
		Path path;
		std::string name;
		bool collaborative;
		std::string description;
		std::string script_hex;
		std::vector<Role> signers;
	};

private:
	Secp256k1::XonlyPubKey buyer;
	Secp256k1::XonlyPubKey seller;
	Secp256k1::XonlyPubKey arbitrator;
	Secp256k1::XonlyPubKey server;
	RelativeTimelock delay;
	Secp256k1::TaprootCommitment taproot;

public:
	explicit
	Script(EscrowOptions const& opts);

	Secp256k1::XonlyPubKey const& key(Role) const;
	RelativeTimelock const& unilateral_delay() const { return delay; }

	std::vector<std::uint8_t> const& script(Path) const;
	Secp256k1::TaprootCommitment const& commitment() const {
		return taproot;
	}
	Secp256k1::XonlyPubKey const& output_key() const {
		return taproot.output_key();
	}
	/* OP_1 <output key>.  */
	std::vector<std::uint8_t> pk_script() const {
		return taproot.pk_script();
	}
	ArkAddress address(Network) const;

	TapLeaf leaf(Path) const;
	/* Throws Escrow::LeafNotFound if the script is not
	 * committed in this tree.
	 */
	TapLeaf find_leaf(std::vector<std::uint8_t> const& script) const;

	/* The roles whose signatures a path needs, in script order.  */
	static std::vector<Role> signers(Path);
	static std::string name(Path);

	std::vector<PathInfo> spending_paths() const;

	/* <delay> CHECKSEQUENCEVERIFY DROP <server> CHECKSIG, the
	 * server's exit from a checkpoint output.
	 */
	std::vector<std::uint8_t> server_unroll_script() const;
};

}

#endif /* !defined(ESCROW_SCRIPT_HPP) */
