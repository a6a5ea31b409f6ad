#include"Bitcoin/opcodes.hpp"
#include"Escrow/Detail/tapscript.hpp"
#include"Escrow/RelativeTimelock.hpp"
#include<iterator>

namespace {

void push_key( std::vector<std::uint8_t>& script
	     , Secp256k1::XonlyPubKey const& k
	     ) {
	std::uint8_t buf[32];
	k.to_buffer(buf);
	script.push_back(Bitcoin::OP_PUSHBYTES_32);
	script.insert(script.end(), buf, buf + 32);
}

/* Minimal little-endian sign-magnitude encoding.  */
std::vector<std::uint8_t> scriptnum(std::int64_t n) {
	auto rv = std::vector<std::uint8_t>();
	if (n == 0)
		return rv;
	auto neg = n < 0;
	auto abs = neg ? std::uint64_t(-(n + 1)) + 1 : std::uint64_t(n);
	while (abs) {
		rv.push_back(std::uint8_t(abs & 0xFF));
		abs >>= 8;
	}
	if (rv.back() & 0x80)
		rv.push_back(neg ? 0x80 : 0x00);
	else if (neg)
		rv.back() |= 0x80;
	return rv;
}

bool read_number( std::int64_t& out
		, std::vector<std::uint8_t>::const_iterator& it
		, std::vector<std::uint8_t>::const_iterator end
		) {
	if (it == end)
		return false;
	auto op = *it;
	if (op == Bitcoin::OP_0) {
		++it;
		out = 0;
		return true;
	}
	if (op == Bitcoin::OP_1NEGATE) {
		++it;
		out = -1;
		return true;
	}
	if (op >= Bitcoin::OP_1 && op <= Bitcoin::OP_16) {
		++it;
		out = op - Bitcoin::OP_1 + 1;
		return true;
	}
	/* CSV takes at most five bytes.  */
	if (op < 1 || op > 5)
		return false;
	++it;
	if (std::distance(it, end) < op)
		return false;
	auto v = std::uint64_t(0);
	for (auto i = 0; i < op; ++i, ++it)
		v |= std::uint64_t(*it) << (8 * i);
	auto top = std::uint64_t(0x80) << (8 * (op - 1));
	if (v & top)
		out = -std::int64_t(v & ~top);
	else
		out = std::int64_t(v);
	return true;
}

}

namespace Escrow { namespace Detail {

std::vector<std::uint8_t> encode_number(std::int64_t n) {
	if (n == 0)
		return std::vector<std::uint8_t>{Bitcoin::OP_0};
	if (n == -1)
		return std::vector<std::uint8_t>{Bitcoin::OP_1NEGATE};
	if (n >= 1 && n <= 16)
		return std::vector<std::uint8_t>{
			std::uint8_t(Bitcoin::OP_1 + (n - 1))
		};
	auto num = scriptnum(n);
	auto rv = std::vector<std::uint8_t>();
	rv.push_back(std::uint8_t(num.size()));
	rv.insert(rv.end(), num.begin(), num.end());
	return rv;
}

std::vector<std::uint8_t>
multisig_script(std::vector<Secp256k1::XonlyPubKey> const& keys) {
	auto rv = std::vector<std::uint8_t>();
	for (auto i = std::size_t(0); i < keys.size(); ++i) {
		push_key(rv, keys[i]);
		if (i + 1 == keys.size())
			rv.push_back(Bitcoin::OP_CHECKSIG);
		else
			rv.push_back(Bitcoin::OP_CHECKSIGVERIFY);
	}
	return rv;
}

std::vector<std::uint8_t>
csv_multisig_script( std::vector<Secp256k1::XonlyPubKey> const& keys
		   , Escrow::RelativeTimelock const& timelock
		   ) {
	auto rv = encode_number(timelock.bip68_sequence());
	rv.push_back(Bitcoin::OP_CHECKSEQUENCEVERIFY);
	rv.push_back(Bitcoin::OP_DROP);
	auto ms = multisig_script(keys);
	rv.insert(rv.end(), ms.begin(), ms.end());
	return rv;
}

bool parse_script( ParsedScript& out
		 , std::vector<std::uint8_t> const& script
		 ) {
	auto it = script.cbegin();
	auto end = script.cend();

	out.has_csv = false;
	out.sequence = 0;
	out.keys.clear();

	if (it != end && *it != Bitcoin::OP_PUSHBYTES_32) {
		auto n = std::int64_t();
		if (!read_number(n, it, end))
			return false;
		if (n < 0 || n > 0xFFFFFFFFLL)
			return false;
		if (std::distance(it, end) < 2)
			return false;
		if (*it++ != Bitcoin::OP_CHECKSEQUENCEVERIFY)
			return false;
		if (*it++ != Bitcoin::OP_DROP)
			return false;
		out.has_csv = true;
		out.sequence = std::uint32_t(n);
	}

	for (;;) {
		if (std::distance(it, end) < 34)
			return false;
		if (*it++ != Bitcoin::OP_PUSHBYTES_32)
			return false;
		try {
			out.keys.push_back(Secp256k1::XonlyPubKey::from_buffer(&*it));
		} catch (Secp256k1::InvalidPubKey const&) {
			return false;
		}
		it += 32;
		auto op = *it++;
		if (op == Bitcoin::OP_CHECKSIG)
			return it == end;
		if (op != Bitcoin::OP_CHECKSIGVERIFY)
			return false;
	}
}

}}
