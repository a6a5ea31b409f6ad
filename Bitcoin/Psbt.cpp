#include"Bitcoin/Psbt.hpp"
#include"Bitcoin/varint.hpp"
#include<sstream>

namespace {

std::uint8_t const magic[5] = {'p', 's', 'b', 't', 0xFF};

std::uint8_t const PSBT_GLOBAL_UNSIGNED_TX = 0x00;
std::uint8_t const PSBT_IN_WITNESS_UTXO = 0x01;
std::uint8_t const PSBT_IN_TAP_SCRIPT_SIG = 0x14;
std::uint8_t const PSBT_IN_TAP_LEAF_SCRIPT = 0x15;

typedef std::vector<std::uint8_t> Bytes;

void write_record(std::ostream& os, Bytes const& key, Bytes const& value) {
	os << Bitcoin::varbytes(key) << Bitcoin::varbytes(value);
}
void write_map(std::ostream& os, Bitcoin::PsbtMap const& m) {
	for (auto const& e : m)
		write_record(os, e.first, e.second);
}

template<typename T>
Bytes serialize(T const& v) {
	auto os = std::ostringstream();
	os << v;
	auto s = os.str();
	return Bytes(s.begin(), s.end());
}

/* Reads through a byte buffer, throwing on overrun.  */
class Reader {
private:
	Bytes const& b;
	std::size_t pos;

public:
	explicit
	Reader(Bytes const& b_) : b(b_), pos(0) { }

	bool at_end() const { return pos >= b.size(); }

	std::uint8_t byte() {
		if (pos >= b.size())
			throw Bitcoin::PsbtError("unexpected end of data");
		return b[pos++];
	}
	std::uint64_t compactsize() {
		auto t = byte();
		auto n = 0;
		if (t < 0xFD)
			return t;
		else if (t == 0xFD)
			n = 2;
		else if (t == 0xFE)
			n = 4;
		else
			n = 8;
		auto v = std::uint64_t(0);
		for (auto i = 0; i < n; ++i)
			v |= std::uint64_t(byte()) << (8 * i);
		return v;
	}
	Bytes bytes() {
		auto len = compactsize();
		if (len > b.size() - pos)
			throw Bitcoin::PsbtError("length exceeds data");
		auto rv = Bytes(b.begin() + pos, b.begin() + pos + len);
		pos += std::size_t(len);
		return rv;
	}

	/* Reads one key-value map up to its separator.  */
	Bitcoin::PsbtMap map() {
		auto rv = Bitcoin::PsbtMap();
		for (;;) {
			auto key = bytes();
			if (key.empty())
				return rv;
			auto value = bytes();
			if (!rv.insert(std::make_pair(key, value)).second)
				throw Bitcoin::PsbtError("duplicate key");
		}
	}
};

template<typename T>
T deserialize(Bytes const& b, char const* what) {
	auto is = std::istringstream(std::string(b.begin(), b.end()));
	auto rv = T();
	is >> rv;
	if (!is || is.peek() != std::char_traits<char>::eof())
		throw Bitcoin::PsbtError(std::string("bad ") + what);
	return rv;
}

Bitcoin::PsbtInput parse_input(Bitcoin::PsbtMap m) {
	auto rv = Bitcoin::PsbtInput();
	for (auto const& e : m) {
		auto const& key = e.first;
		auto const& value = e.second;
		switch (key[0]) {
		case PSBT_IN_WITNESS_UTXO:
			if (key.size() != 1)
				throw Bitcoin::PsbtError("bad witness utxo key");
			rv.has_witness_utxo = true;
			rv.witness_utxo = deserialize<Bitcoin::TxOut>(
				value, "witness utxo"
			);
			break;
		case PSBT_IN_TAP_SCRIPT_SIG:
			if (key.size() != 65)
				throw Bitcoin::PsbtError("bad tap script sig key");
			if (value.size() != 64 && value.size() != 65)
				throw Bitcoin::PsbtError("bad tap script sig");
			rv.tap_script_sigs[Bytes(key.begin() + 1, key.end())] = value;
			break;
		case PSBT_IN_TAP_LEAF_SCRIPT: {
			if (key.size() < 34 || (key.size() - 34) % 32 != 0)
				throw Bitcoin::PsbtError("bad control block");
			if (value.empty())
				throw Bitcoin::PsbtError("bad tap leaf script");
			auto leaf = Bitcoin::PsbtTapLeafScript();
			leaf.control_block = Bytes(key.begin() + 1, key.end());
			leaf.script = Bytes(value.begin(), value.end() - 1);
			leaf.leaf_version = value.back();
			rv.tap_leaf_scripts.push_back(std::move(leaf));
		} break;
		default:
			rv.unknown.insert(e);
			break;
		}
	}
	return rv;
}

Bitcoin::PsbtMap unparse_input(Bitcoin::PsbtInput const& in) {
	auto rv = in.unknown;
	if (in.has_witness_utxo)
		rv[Bytes(1, PSBT_IN_WITNESS_UTXO)] = serialize(in.witness_utxo);
	for (auto const& s : in.tap_script_sigs) {
		auto key = Bytes(1, PSBT_IN_TAP_SCRIPT_SIG);
		key.insert(key.end(), s.first.begin(), s.first.end());
		rv[key] = s.second;
	}
	for (auto const& l : in.tap_leaf_scripts) {
		auto key = Bytes(1, PSBT_IN_TAP_LEAF_SCRIPT);
		key.insert(key.end(), l.control_block.begin(), l.control_block.end());
		auto value = l.script;
		value.push_back(l.leaf_version);
		rv[key] = value;
	}
	return rv;
}

}

namespace Bitcoin {

Psbt::Psbt(Bitcoin::Tx tx_)
	: tx(std::move(tx_))
	, inputs(tx.inputs.size())
	, outputs(tx.outputs.size())
	{ }

std::vector<std::uint8_t> Psbt::to_bytes() const {
	auto os = std::ostringstream();
	os.write((char const*) magic, sizeof(magic));

	auto global = global_unknown;
	global[Bytes(1, PSBT_GLOBAL_UNSIGNED_TX)] = serialize(tx);
	write_map(os, global);
	os.put(0x00);

	for (auto const& in : inputs) {
		write_map(os, unparse_input(in));
		os.put(0x00);
	}
	for (auto const& out : outputs) {
		write_map(os, out.unknown);
		os.put(0x00);
	}

	auto s = os.str();
	return Bytes(s.begin(), s.end());
}

Psbt Psbt::from_bytes(std::vector<std::uint8_t> const& b) {
	auto r = Reader(b);
	for (auto m : magic)
		if (r.byte() != m)
			throw PsbtError("bad magic");

	auto rv = Psbt();
	rv.global_unknown = r.map();
	auto it = rv.global_unknown.find(Bytes(1, PSBT_GLOBAL_UNSIGNED_TX));
	if (it == rv.global_unknown.end())
		throw PsbtError("no unsigned transaction");
	rv.tx = deserialize<Bitcoin::Tx>(it->second, "unsigned transaction");
	rv.global_unknown.erase(it);

	for (auto const& in : rv.tx.inputs)
		if (!in.scriptSig.empty() || !in.witness.empty())
			throw PsbtError("unsigned transaction has signatures");

	for (auto i = std::size_t(0); i < rv.tx.inputs.size(); ++i)
		rv.inputs.push_back(parse_input(r.map()));
	for (auto i = std::size_t(0); i < rv.tx.outputs.size(); ++i) {
		auto out = PsbtOutput();
		out.unknown = r.map();
		rv.outputs.push_back(std::move(out));
	}
	if (!r.at_end())
		throw PsbtError("trailing data");
	return rv;
}

void Psbt::merge_signatures(Psbt const& o) {
	if (tx != o.tx || inputs.size() != o.inputs.size())
		throw PsbtError("merging signatures of a different transaction");
	for (auto i = std::size_t(0); i < inputs.size(); ++i)
		inputs[i].tap_script_sigs.insert( o.inputs[i].tap_script_sigs.begin()
						, o.inputs[i].tap_script_sigs.end()
						);
}

std::size_t Psbt::num_signatures() const {
	auto rv = std::size_t(0);
	for (auto const& in : inputs)
		rv += in.tap_script_sigs.size();
	return rv;
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::Psbt const& p) {
	auto b = p.to_bytes();
	os.write((char const*) b.data(), b.size());
	return os;
}
