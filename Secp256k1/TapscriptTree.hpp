#ifndef SECP256K1_TAPSCRIPTTREE_HPP
#define SECP256K1_TAPSCRIPTTREE_HPP

#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 {

/* Thrown when a tree is built from no leaves, or a leaf index
 * is out of range.
 */
class InvalidTapTree : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidTapTree(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid taproot tree: " + msg
		  ) { }
};

/* BIP341 tapscript leaf version.  */
std::uint8_t const tapleaf_version = 0xc0;

/* TapLeaf(version || compactsize(len) || script).  */
Sha256::Hash tapleaf_hash( std::vector<std::uint8_t> const& script
			 , std::uint8_t version = tapleaf_version
			 );
/* TapBranch of the two children, smaller first.  */
Sha256::Hash tapbranch_hash(Sha256::Hash const& a, Sha256::Hash const& b);

/** class Secp256k1::TapscriptTree
 *
 * @brief a merkle tree of tapscript leaves.
 *
 * @desc All leaves weigh the same.  The tree is built by
 * repeatedly stable-sorting the pending nodes by weight,
 * heaviest first, then joining the last two into a branch.
 * Leaf indices follow the order the scripts were given in.
 */
class TapscriptTree {
private:
	std::vector<std::vector<std::uint8_t>> scripts;
	std::vector<Sha256::Hash> leaves;
	/* Sibling hashes per leaf, deepest first.  */
	std::vector<std::vector<Sha256::Hash>> paths;
	Sha256::Hash root_hash;

public:
	explicit
	TapscriptTree(std::vector<std::vector<std::uint8_t>> scripts);

	std::size_t size() const { return scripts.size(); }
	std::vector<std::uint8_t> const& script(std::size_t i) const;
	Sha256::Hash const& leaf_hash(std::size_t i) const;
	std::vector<Sha256::Hash> const& merkle_path(std::size_t i) const;
	Sha256::Hash const& root() const { return root_hash; }

	/* Index of the given script, or size() if absent.  */
	std::size_t find(std::vector<std::uint8_t> const& script) const;
};

/** Secp256k1::nums_key
 *
 * @brief the BIP341 "nothing up my sleeve" point, whose
 * discrete logarithm is unknown, making the key path
 * unspendable.
 */
XonlyPubKey nums_key();

/** class Secp256k1::TaprootCommitment
 *
 * @brief an internal key tweaked with a tapscript tree root.
 */
class TaprootCommitment {
private:
	XonlyPubKey internal;
	TapscriptTree taptree;
	XonlyPubKey output;
	int output_parity;

public:
	TaprootCommitment(XonlyPubKey internal, TapscriptTree tree);

	XonlyPubKey const& internal_key() const { return internal; }
	XonlyPubKey const& output_key() const { return output; }
	int parity() const { return output_parity; }
	TapscriptTree const& tree() const { return taptree; }

	/* (version | parity) || internal key || merkle path.  */
	std::vector<std::uint8_t> control_block(std::size_t leaf) const;
	/* OP_1 <32-byte output key>.  */
	std::vector<std::uint8_t> pk_script() const;
};

}

#endif /* !defined(SECP256K1_TAPSCRIPTTREE_HPP) */
