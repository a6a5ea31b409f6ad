#include"Util/Bech32.hpp"
#include<algorithm>

namespace {

auto const charset = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

std::uint32_t const bech32_const = 1;
std::uint32_t const bech32m_const = 0x2bc830a3;

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	static std::uint32_t const gen[5] =
	{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= gen[i];
	}
	return chk;
}

std::vector<std::uint8_t> hrp_expand(std::string const& hrp) {
	auto rv = std::vector<std::uint8_t>();
	rv.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) >> 5);
	rv.push_back(0);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) & 0x1f);
	return rv;
}

std::uint32_t encoding_const(Util::Bech32::Encoding enc) {
	return enc == Util::Bech32::Bech32m ? bech32m_const : bech32_const;
}

}

namespace Util { namespace Bech32 {

std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& data5
		  , Encoding enc
		  ) {
	auto values = hrp_expand(hrp);
	values.insert(values.end(), data5.begin(), data5.end());
	values.resize(values.size() + 6, 0);
	auto mod = polymod(values) ^ encoding_const(enc);

	auto rv = hrp + "1";
	for (auto d : data5)
		rv.push_back(charset[d & 0x1f]);
	for (auto i = 0; i < 6; ++i)
		rv.push_back(charset[(mod >> (5 * (5 - i))) & 0x1f]);
	return rv;
}

Encoding decode( std::string& hrp
	       , std::vector<std::uint8_t>& data5
	       , std::string const& bech32
	       ) {
	auto lower = false;
	auto upper = false;
	for (auto c : bech32) {
		if (c < 33 || c > 126)
			return Invalid;
		if ('a' <= c && c <= 'z')
			lower = true;
		if ('A' <= c && c <= 'Z')
			upper = true;
	}
	if (lower && upper)
		return Invalid;

	auto pos = bech32.rfind('1');
	if (pos == std::string::npos || pos == 0 || pos + 7 > bech32.size())
		return Invalid;

	auto h = std::string();
	for (auto i = std::size_t(0); i < pos; ++i) {
		auto c = bech32[i];
		h.push_back(('A' <= c && c <= 'Z') ? char(c - 'A' + 'a') : c);
	}

	auto values = std::vector<std::uint8_t>();
	for (auto i = pos + 1; i < bech32.size(); ++i) {
		auto c = bech32[i];
		if ('A' <= c && c <= 'Z')
			c = char(c - 'A' + 'a');
		auto idx = charset.find(c);
		if (idx == std::string::npos)
			return Invalid;
		values.push_back(std::uint8_t(idx));
	}

	auto check = hrp_expand(h);
	check.insert(check.end(), values.begin(), values.end());
	auto mod = polymod(check);
	auto enc = Invalid;
	if (mod == bech32_const)
		enc = Bech32;
	else if (mod == bech32m_const)
		enc = Bech32m;
	else
		return Invalid;

	hrp = std::move(h);
	data5.assign(values.begin(), values.end() - 6);
	return enc;
}

bool convertbits( std::vector<std::uint8_t>& out
		, std::vector<std::uint8_t> const& in
		, int frombits, int tobits
		, bool pad
		) {
	auto acc = std::uint32_t(0);
	auto bits = 0;
	auto maxv = (std::uint32_t(1) << tobits) - 1;
	auto max_acc = (std::uint32_t(1) << (frombits + tobits - 1)) - 1;
	out.clear();
	for (auto v : in) {
		if ((std::uint32_t(v) >> frombits) != 0)
			return false;
		acc = ((acc << frombits) | v) & max_acc;
		bits += frombits;
		while (bits >= tobits) {
			bits -= tobits;
			out.push_back(std::uint8_t((acc >> bits) & maxv));
		}
	}
	if (pad) {
		if (bits > 0)
			out.push_back(std::uint8_t((acc << (tobits - bits)) & maxv));
	} else if (bits >= frombits
		|| ((acc << (tobits - bits)) & maxv) != 0) {
		return false;
	}
	return true;
}

}}
