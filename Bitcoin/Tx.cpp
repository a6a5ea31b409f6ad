#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sstream>
#include<stdexcept>

namespace {

bool has_witness(Bitcoin::Tx const& tx) {
	for (auto const& i : tx.inputs)
		if (!i.witness.empty())
			return true;
	return false;
}

/* The txid commits to the legacy form, so witnesses are
 * optional here.  */
void serialize(std::ostream& os, Bitcoin::Tx const& tx, bool witness) {
	os << Bitcoin::le(tx.nVersion);
	if (witness)
		os.write("\x00\x01", 2);

	os << Bitcoin::varint(std::uint64_t(tx.inputs.size()));
	for (auto const& i : tx.inputs)
		os << i;
	os << Bitcoin::varint(std::uint64_t(tx.outputs.size()));
	for (auto const& o : tx.outputs)
		os << o;

	if (witness)
		for (auto const& i : tx.inputs)
			os << i.witness;

	os << Bitcoin::le(tx.nLockTime);
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::Tx const& v) {
	serialize(os, v, has_witness(v));
	return os;
}

std::istream& operator>>(std::istream& is, Bitcoin::Tx& v) {
	auto count = std::uint64_t();
	is >> Bitcoin::le(v.nVersion) >> Bitcoin::varint(count);

	/* An empty input list cannot be spent, so a zero count
	 * here means the segwit marker follows.  */
	auto witness = false;
	if (count == 0) {
		if (is.get() != 0x01) {
			is.setstate(std::ios_base::failbit);
			return is;
		}
		witness = true;
		is >> Bitcoin::varint(count);
	}

	v.inputs.clear();
	for (auto n = std::uint64_t(0); n < count && is; ++n) {
		v.inputs.emplace_back();
		is >> v.inputs.back();
	}

	is >> Bitcoin::varint(count);
	v.outputs.clear();
	for (auto n = std::uint64_t(0); n < count && is; ++n) {
		v.outputs.emplace_back();
		is >> v.outputs.back();
	}

	for (auto& i : v.inputs) {
		if (witness)
			is >> i.witness;
		else
			i.witness = Bitcoin::WitnessField();
	}

	return is >> Bitcoin::le(v.nLockTime);
}

namespace Bitcoin {

Tx::Tx(std::string const& hex) {
	auto bytes = Util::Str::hexread(hex);
	auto is = std::istringstream(std::string(bytes.begin(), bytes.end()));
	if (!(is >> *this))
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Tx: cannot parse transaction"
		);
	if (is.peek() != std::char_traits<char>::eof())
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Tx: trailing bytes after transaction"
		);
}

TxId Tx::get_txid() const {
	Sha256::HasherStream hasher;
	serialize(hasher, *this, false);
	return TxId(Sha256::fun(std::move(hasher).finalize()));
}

Tx::operator std::string() const {
	auto os = std::ostringstream();
	os << *this;
	auto bytes = os.str();
	return Util::Str::hexdump(bytes.data(), bytes.size());
}

}
