#include"Bitcoin/TxId.hpp"
#include"Escrow/Detail/tapscript.hpp"
#include"Escrow/OffchainTx.hpp"
#include"Secp256k1/TapscriptTree.hpp"

namespace {

auto const ark_tx_version = std::uint32_t(3);

void attach_leaf( Bitcoin::PsbtInput& in
		, Bitcoin::TxOut prevout
		, Escrow::TapLeaf const& leaf
		) {
	in.has_witness_utxo = true;
	in.witness_utxo = std::move(prevout);
	in.tap_leaf_scripts.push_back(Bitcoin::PsbtTapLeafScript{
		leaf.control_block, leaf.script, leaf.leaf_version
	});
}

}

namespace Escrow {

Bitcoin::TxOut anchor_output() {
	return Bitcoin::TxOut(0, std::vector<std::uint8_t>{0x51, 0x02, 0x4e, 0x73});
}

std::uint32_t leaf_sequence(std::vector<std::uint8_t> const& script) {
	auto parsed = Detail::ParsedScript();
	if (Detail::parse_script(parsed, script) && parsed.has_csv)
		return parsed.sequence;
	return 0xFFFFFFFF;
}

OffchainTx OffchainTx::build( std::vector<OffchainInput> const& inputs
			    , std::vector<Bitcoin::TxOut> const& outputs
			    , std::vector<std::uint8_t> const& server_unroll
			    ) {
	auto rv = OffchainTx();

	auto ark = Bitcoin::Tx();
	ark.nVersion = ark_tx_version;
	auto ark_prevouts = std::vector<Bitcoin::TxOut>();
	auto ark_leaves = std::vector<TapLeaf>();

	for (auto const& in : inputs) {
		auto sequence = leaf_sequence(in.leaf.script);

		auto checkpoint_tree = Secp256k1::TapscriptTree(
			std::vector<std::vector<std::uint8_t>>{ server_unroll
								, in.leaf.script
								}
		);
		auto checkpoint_taproot = Secp256k1::TaprootCommitment(
			Secp256k1::nums_key(), std::move(checkpoint_tree)
		);

		auto cp = Bitcoin::Tx();
		cp.nVersion = ark_tx_version;
		cp.inputs.emplace_back(in.vtxo.txid, in.vtxo.vout, sequence);
		cp.outputs.emplace_back(in.vtxo.value, checkpoint_taproot.pk_script());
		cp.outputs.push_back(anchor_output());

		auto cp_psbt = Bitcoin::Psbt(cp);
		attach_leaf( cp_psbt.inputs[0]
			   , Bitcoin::TxOut(in.vtxo.value, in.pk_script)
			   , in.leaf
			   );

		ark.inputs.emplace_back(cp.get_txid(), 0, sequence);
		ark_prevouts.push_back(cp.outputs[0]);
		ark_leaves.push_back(TapLeaf{ in.leaf.script
					    , Secp256k1::tapleaf_version
					    , checkpoint_taproot.control_block(1)
					    });

		rv.checkpoints.push_back(std::move(cp_psbt));
	}

	ark.outputs = outputs;
	ark.outputs.push_back(anchor_output());

	rv.ark_tx = Bitcoin::Psbt(ark);
	for (auto i = std::size_t(0); i < ark_leaves.size(); ++i)
		attach_leaf(rv.ark_tx.inputs[i], ark_prevouts[i], ark_leaves[i]);

	return rv;
}

}
