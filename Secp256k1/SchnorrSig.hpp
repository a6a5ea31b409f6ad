#ifndef SECP256K1_SCHNORRSIG_HPP
#define SECP256K1_SCHNORRSIG_HPP

#include<cstdint>
#include<vector>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class XonlyPubKey; }
namespace Sha256 { class Hash; }

namespace Secp256k1 {

/** class Secp256k1::SchnorrSig
 *
 * @brief a 64-byte BIP340 signature.
 */
class SchnorrSig {
private:
	std::uint8_t data[64];

	SchnorrSig( Secp256k1::PrivKey const&
		  , Sha256::Hash const&
		  );
	explicit
	SchnorrSig(std::uint8_t const buffer[64]);

public:
	SchnorrSig();
	SchnorrSig(SchnorrSig const&) =default;
	SchnorrSig& operator=(SchnorrSig const&) =default;

	static
	SchnorrSig from_buffer(std::uint8_t const buffer[64]) {
		return SchnorrSig(buffer);
	}

	void to_buffer(std::uint8_t buffer[64]) const;
	std::vector<std::uint8_t> to_bytes() const;

	bool valid( Secp256k1::XonlyPubKey const& pk
		  , Sha256::Hash const& m
		  ) const;

	/* Signs with fresh auxiliary randomness from libsodium.  */
	static
	SchnorrSig create( Secp256k1::PrivKey const& sk
			 , Sha256::Hash const& m
			 ) {
		return SchnorrSig(sk, m);
	}
};

}

#endif /* !defined(SECP256K1_SCHNORRSIG_HPP) */
