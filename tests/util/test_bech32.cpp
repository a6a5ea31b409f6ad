#undef NDEBUG
#include"Util/Bech32.hpp"
#include<assert.h>

namespace {

Util::Bech32::Encoding check(std::string const& s) {
	auto hrp = std::string();
	auto data = std::vector<std::uint8_t>();
	return Util::Bech32::decode(hrp, data, s);
}

}

int main() {
	using Util::Bech32::Bech32;
	using Util::Bech32::Bech32m;
	using Util::Bech32::Invalid;

	/* BIP173 and BIP350 checksums.  */
	assert(check("A12UEL5L") == Bech32);
	assert(check("a12uel5l") == Bech32);
	assert(check("A1LQFN3A") == Bech32m);
	assert(check("a1lqfn3a") == Bech32m);
	assert(check("?1v759aa") == Bech32m);
	assert(check("abcdef1l7aum6echk45nj3s0wdvt2fg8x9yrzpqzd3ryx") == Bech32m);

	/* Mixed case, no separator, short checksum, bad character,
	 * and a flipped character.
	 */
	assert(check("A1LqFN3A") == Invalid);
	assert(check("alqfn3a") == Invalid);
	assert(check("a1fn3a") == Invalid);
	assert(check("a1lqfn3b") == Invalid);
	assert(check("a1lqfn3i") == Invalid);

	{
		auto hrp = std::string();
		auto data = std::vector<std::uint8_t>();
		assert(Util::Bech32::decode(hrp, data, "A1LQFN3A") == Bech32m);
		assert(hrp == "a");
		assert(data.empty());
		assert(Util::Bech32::encode(hrp, data) == "a1lqfn3a");
		assert(Util::Bech32::encode(hrp, data, Bech32) == "a12uel5l");
	}

	/* Ark addresses carry 65 bytes, far past the BIP173 limit.  */
	{
		auto payload = std::vector<std::uint8_t>(65);
		for (auto i = std::size_t(0); i < payload.size(); ++i)
			payload[i] = std::uint8_t(i * 7);
		auto data5 = std::vector<std::uint8_t>();
		assert(Util::Bech32::convertbits(data5, payload, 8, 5, true));
		auto s = Util::Bech32::encode("tark", data5);
		assert(s.size() > 90);
		assert(s.substr(0, 5) == "tark1");

		auto hrp = std::string();
		auto back5 = std::vector<std::uint8_t>();
		assert(Util::Bech32::decode(hrp, back5, s) == Bech32m);
		assert(hrp == "tark");
		auto back = std::vector<std::uint8_t>();
		assert(Util::Bech32::convertbits(back, back5, 5, 8, false));
		assert(back == payload);
	}

	/* Leftover non-zero padding is refused.  */
	{
		auto out = std::vector<std::uint8_t>();
		assert(!Util::Bech32::convertbits(out, {0x1f}, 5, 8, false));
		assert(!Util::Bech32::convertbits(out, {0x20}, 5, 8, true));
	}

	return 0;
}
