#include"Escrow/ArkAddress.hpp"
#include"Escrow/Error.hpp"
#include"Util/Bech32.hpp"

namespace {

auto const address_version = std::uint8_t(0);
auto const payload_size = std::size_t(1 + 32 + 32);

}

namespace Escrow {

ArkAddress ArkAddress::decode(std::string const& s) {
	auto hrp = std::string();
	auto data5 = std::vector<std::uint8_t>();
	auto enc = Util::Bech32::decode(hrp, data5, s);
	if (enc == Util::Bech32::Invalid)
		throw InvalidAddress("bad checksum or characters: " + s);
	if (enc != Util::Bech32::Bech32m)
		throw InvalidAddress("not bech32m: " + s);
	if (hrp != "ark" && hrp != "tark")
		throw InvalidAddress("unknown prefix " + hrp);

	auto data = std::vector<std::uint8_t>();
	if (!Util::Bech32::convertbits(data, data5, 5, 8, false))
		throw InvalidAddress("bad padding: " + s);
	if (data.size() != payload_size)
		throw InvalidAddress( "payload is " + std::to_string(data.size())
				    + " bytes, expected 65"
				    );
	if (data[0] != address_version)
		throw InvalidAddress( "unknown version "
				    + std::to_string(unsigned(data[0]))
				    );

	try {
		auto server = Secp256k1::XonlyPubKey::from_buffer(&data[1]);
		auto output = Secp256k1::XonlyPubKey::from_buffer(&data[33]);
		return ArkAddress(std::move(hrp), std::move(server), std::move(output));
	} catch (Secp256k1::InvalidPubKey const&) {
		throw InvalidAddress("key not on curve: " + s);
	}
}

std::string ArkAddress::encode() const {
	auto data = std::vector<std::uint8_t>(payload_size);
	data[0] = address_version;
	server.to_buffer(&data[1]);
	output.to_buffer(&data[33]);

	auto data5 = std::vector<std::uint8_t>();
	Util::Bech32::convertbits(data5, data, 8, 5, true);
	return Util::Bech32::encode(hrp, data5, Util::Bech32::Bech32m);
}

std::vector<std::uint8_t> ArkAddress::pk_script() const {
	auto rv = std::vector<std::uint8_t>{0x51, 0x20};
	auto key = output.to_bytes();
	rv.insert(rv.end(), key.begin(), key.end());
	return rv;
}

}
