#undef NDEBUG
#include"Bitcoin/Psbt.hpp"
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Util/Str.hpp"
#include<assert.h>

namespace {

typedef std::vector<std::uint8_t> Bytes;

Bitcoin::Tx make_tx() {
	auto tx = Bitcoin::Tx();
	tx.nVersion = 3;
	tx.inputs.emplace_back(Bitcoin::TxId("2e29a6633eafc1d556c663bb26056b6ed1bfdb5f148029907e8e01728e375e38"), 0);
	tx.outputs.emplace_back(1000, Util::Str::hexread("5120" "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"));
	tx.outputs.emplace_back(0, Util::Str::hexread("51024e73"));
	return tx;
}

bool rejects(Bytes const& b) {
	try {
		(void) Bitcoin::Psbt::from_bytes(b);
	} catch (Bitcoin::PsbtError const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto psbt = Bitcoin::Psbt(make_tx());
	assert(psbt.inputs.size() == 1);
	assert(psbt.outputs.size() == 2);

	psbt.inputs[0].has_witness_utxo = true;
	psbt.inputs[0].witness_utxo = Bitcoin::TxOut(1000, Util::Str::hexread("5120" "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"));
	auto leaf = Bitcoin::PsbtTapLeafScript();
	leaf.control_block = Bytes(33, 0xc1);
	leaf.script = Util::Str::hexread("20" "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798" "ac");
	leaf.leaf_version = 0xc0;
	psbt.inputs[0].tap_leaf_scripts.push_back(leaf);
	psbt.inputs[0].tap_script_sigs[Bytes(64, 0x01)] = Bytes(64, 0xAA);
	/* A record we do not interpret survives.  */
	psbt.inputs[0].unknown[Bytes{0xFC, 0x01}] = Bytes{0x42};
	psbt.outputs[1].unknown[Bytes{0xFC, 0x02}] = Bytes{0x43};

	auto bytes = psbt.to_bytes();
	assert(Util::Str::hexdump(Bytes(bytes.begin(), bytes.begin() + 5)) == "70736274ff");
	auto parsed = Bitcoin::Psbt::from_bytes(bytes);
	assert(parsed == psbt);
	assert(parsed.num_signatures() == 1);
	assert(parsed.inputs[0].tap_leaf_scripts[0].leaf_version == 0xc0);

	/* Malformed inputs.  */
	auto bad_magic = bytes;
	bad_magic[0] = 'P';
	assert(rejects(bad_magic));
	auto trailing = bytes;
	trailing.push_back(0x00);
	assert(rejects(trailing));
	assert(rejects(Bytes(bytes.begin(), bytes.end() - 1)));

	/* An unsigned transaction carrying a witness is rejected.  */
	auto witnessed = make_tx();
	witnessed.inputs[0].witness.witnesses.push_back(Bytes(64, 0x00));
	auto bad = Bitcoin::Psbt(make_tx());
	bad.tx = witnessed;
	assert(rejects(bad.to_bytes()));

	/* Merging adds what is missing and keeps what is there.  */
	auto other = Bitcoin::Psbt(make_tx());
	other.inputs[0].tap_script_sigs[Bytes(64, 0x01)] = Bytes(64, 0xBB);
	other.inputs[0].tap_script_sigs[Bytes(64, 0x02)] = Bytes(64, 0xCC);
	auto merged = psbt;
	merged.merge_signatures(other);
	assert(merged.num_signatures() == 2);
	assert(merged.inputs[0].tap_script_sigs[Bytes(64, 0x01)] == Bytes(64, 0xAA));
	assert(merged.inputs[0].tap_script_sigs[Bytes(64, 0x02)] == Bytes(64, 0xCC));
	assert(merged.inputs[0].tap_leaf_scripts == psbt.inputs[0].tap_leaf_scripts);

	auto different_tx = make_tx();
	different_tx.nLockTime = 1;
	auto stranger = Bitcoin::Psbt(different_tx);
	auto threw = false;
	try {
		merged.merge_signatures(stranger);
	} catch (Bitcoin::PsbtError const&) {
		threw = true;
	}
	assert(threw);
	assert(merged.num_signatures() == 2);

	return 0;
}
