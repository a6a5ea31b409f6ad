#ifndef ESCROW_OFFCHAINTX_HPP
#define ESCROW_OFFCHAINTX_HPP

#include"Bitcoin/Psbt.hpp"
#include"Bitcoin/TxOut.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/Script.hpp"
#include<cstdint>
#include<vector>

namespace Escrow {

/* A virtual output to spend, and the leaf to spend it by.  */
struct OffchainInput {
	Vtxo vtxo;
	/* The script the output pays to.  */
	std::vector<std::uint8_t> pk_script;
	TapLeaf leaf;
};

/** struct Escrow::OffchainTx
 *
 * @brief an Ark transaction and the checkpoint
 * transactions it spends.
 *
 * @desc Each input gets its own checkpoint, which moves
 * the full value into an output the server can unroll
 * after the delay, or the original leaf signers can spend
 * right away.
 * The ark transaction then spends every checkpoint through
 * that same leaf.
 * Both kinds carry a zero-value pay-to-anchor output.
 */
struct OffchainTx {
	Bitcoin::Psbt ark_tx;
	std::vector<Bitcoin::Psbt> checkpoints;

	static OffchainTx build( std::vector<OffchainInput> const& inputs
			       , std::vector<Bitcoin::TxOut> const& outputs
			       , std::vector<std::uint8_t> const& server_unroll
			       );
};

/* OP_1 <0x4e73>, zero value.  */
Bitcoin::TxOut anchor_output();

/* The nSequence a leaf needs: its CSV value, or final.  */
std::uint32_t leaf_sequence(std::vector<std::uint8_t> const& script);

}

#endif /* !defined(ESCROW_OFFCHAINTX_HPP) */
