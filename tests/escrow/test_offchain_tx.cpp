#undef NDEBUG
#include"Bitcoin/TxId.hpp"
#include"Escrow/OffchainTx.hpp"
#include"Escrow/Script.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Util/Str.hpp"
#include<assert.h>

namespace {

typedef std::vector<std::uint8_t> Bytes;

Bytes key(unsigned n) {
	auto sk = Secp256k1::PrivKey(Util::Str::fmt("%064x", n));
	return Secp256k1::XonlyPubKey(sk).to_bytes();
}

Bytes p2tr(unsigned n) {
	auto rv = Bytes{0x51, 0x20};
	auto k = key(n);
	rv.insert(rv.end(), k.begin(), k.end());
	return rv;
}

}

int main() {
	auto script = Escrow::Script(Escrow::EscrowOptions{
		key(1), key(2), key(3), key(4),
		Escrow::RelativeTimelock::from_delay(144)
	});
	auto vtxo = Escrow::Vtxo{
		Bitcoin::TxId("2e29a6633eafc1d556c663bb26056b6ed1bfdb5f148029907e8e01728e375e38"),
		1, 101, ""
	};

	/* Collaborative direct settlement: final sequence.  */
	{
		auto leaf = script.leaf(Escrow::Script::Direct);
		auto outs = std::vector<Bitcoin::TxOut>{
			Bitcoin::TxOut(50, p2tr(11)),
			Bitcoin::TxOut(51, p2tr(12))
		};
		auto tx = Escrow::OffchainTx::build(
			{ Escrow::OffchainInput{vtxo, script.pk_script(), leaf} },
			outs,
			script.server_unroll_script()
		);

		assert(tx.checkpoints.size() == 1);
		auto const& cp = tx.checkpoints[0];
		assert(cp.tx.nVersion == 3);
		assert(cp.tx.inputs.size() == 1);
		assert(cp.tx.inputs[0].prevTxid == vtxo.txid);
		assert(cp.tx.inputs[0].prevOut == 1);
		assert(cp.tx.inputs[0].nSequence == 0xFFFFFFFF);
		/* Full value onward, plus the anchor.  */
		assert(cp.tx.outputs.size() == 2);
		assert(cp.tx.outputs[0].amount == 101);
		assert(cp.tx.outputs[1] == Escrow::anchor_output());
		assert(Util::Str::hexdump(cp.tx.outputs[1].scriptPubKey) == "51024e73");
		assert(cp.inputs[0].has_witness_utxo);
		assert(cp.inputs[0].witness_utxo.amount == 101);
		assert(cp.inputs[0].witness_utxo.scriptPubKey == script.pk_script());
		assert(cp.inputs[0].tap_leaf_scripts.size() == 1);
		assert(cp.inputs[0].tap_leaf_scripts[0].script == leaf.script);
		assert(cp.inputs[0].tap_leaf_scripts[0].control_block == leaf.control_block);
		assert(cp.inputs[0].tap_script_sigs.empty());

		/* The checkpoint output commits to the server's exit
		 * and the leaf being spent.
		 */
		auto cp_taproot = Secp256k1::TaprootCommitment(
			Secp256k1::nums_key(),
			Secp256k1::TapscriptTree(std::vector<Bytes>{
				script.server_unroll_script(), leaf.script
			})
		);
		assert(cp.tx.outputs[0].scriptPubKey == cp_taproot.pk_script());

		auto const& ark = tx.ark_tx;
		assert(ark.tx.nVersion == 3);
		assert(ark.tx.inputs.size() == 1);
		assert(ark.tx.inputs[0].prevTxid == cp.tx.get_txid());
		assert(ark.tx.inputs[0].prevOut == 0);
		assert(ark.tx.outputs.size() == 3);
		assert(ark.tx.outputs[0] == outs[0]);
		assert(ark.tx.outputs[1] == outs[1]);
		assert(ark.tx.outputs[2] == Escrow::anchor_output());
		auto total = std::uint64_t(0);
		for (auto const& o : ark.tx.outputs)
			total += o.amount;
		assert(total == vtxo.value);

		assert(ark.inputs[0].witness_utxo == cp.tx.outputs[0]);
		assert(ark.inputs[0].tap_leaf_scripts[0].script == leaf.script);
		assert(ark.inputs[0].tap_leaf_scripts[0].control_block
		    == cp_taproot.control_block(1));
	}

	/* A unilateral leaf sets the relative timelock.  */
	{
		auto leaf = script.leaf(Escrow::Script::UnilateralRelease);
		assert(Escrow::leaf_sequence(leaf.script) == 144);
		assert(Escrow::leaf_sequence(script.script(Escrow::Script::Release))
		    == 0xFFFFFFFF);
		auto tx = Escrow::OffchainTx::build(
			{ Escrow::OffchainInput{vtxo, script.pk_script(), leaf} },
			{ Bitcoin::TxOut(101, p2tr(12)) },
			script.server_unroll_script()
		);
		assert(tx.checkpoints[0].tx.inputs[0].nSequence == 144);
		assert(tx.ark_tx.tx.inputs[0].nSequence == 144);
	}

	/* One checkpoint per input.  */
	{
		auto second = vtxo;
		second.vout = 2;
		second.value = 7;
		auto leaf = script.leaf(Escrow::Script::Refund);
		auto tx = Escrow::OffchainTx::build(
			{ Escrow::OffchainInput{vtxo, script.pk_script(), leaf}
			, Escrow::OffchainInput{second, script.pk_script(), leaf}
			},
			{ Bitcoin::TxOut(108, p2tr(11)) },
			script.server_unroll_script()
		);
		assert(tx.checkpoints.size() == 2);
		assert(tx.ark_tx.tx.inputs.size() == 2);
		assert(tx.checkpoints[1].tx.outputs[0].amount == 7);
		assert(tx.ark_tx.tx.inputs[1].prevTxid == tx.checkpoints[1].tx.get_txid());
	}

	return 0;
}
