#ifndef ESCROW_ARKADDRESS_HPP
#define ESCROW_ARKADDRESS_HPP

#include"Secp256k1/XonlyPubKey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Escrow {

/** class Escrow::ArkAddress
 *
 * @brief an Ark offchain address.
 *
 * @desc The text form is bech32m over
 * `version(0) || server key || output key`, with the
 * human-readable part naming the network.
 */
class ArkAddress {
private:
	std::string hrp;
	Secp256k1::XonlyPubKey server;
	Secp256k1::XonlyPubKey output;

public:
	ArkAddress( std::string hrp_
		  , Secp256k1::XonlyPubKey server_
		  , Secp256k1::XonlyPubKey output_
		  ) : hrp(std::move(hrp_))
		    , server(std::move(server_))
		    , output(std::move(output_))
		    { }

	/* Throws Escrow::InvalidAddress on a bad checksum, encoding,
	 * version, length or key.
	 */
	static ArkAddress decode(std::string const&);
	std::string encode() const;

	std::string const& prefix() const { return hrp; }
	Secp256k1::XonlyPubKey const& server_key() const { return server; }
	Secp256k1::XonlyPubKey const& output_key() const { return output; }

	/* OP_1 <output key>.  */
	std::vector<std::uint8_t> pk_script() const;

	bool operator==(ArkAddress const& o) const {
		return hrp == o.hrp && server == o.server && output == o.output;
	}
	bool operator!=(ArkAddress const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(ESCROW_ARKADDRESS_HPP) */
