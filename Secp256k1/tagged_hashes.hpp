#ifndef SECP256K1_TAGGED_HASHES_HPP
#define SECP256K1_TAGGED_HASHES_HPP

#include<cstddef>
#include<cstdint>

namespace Sha256 { class Hash; }

namespace Secp256k1 {

namespace Tag {

enum tap : std::uint8_t { LEAF, BRANCH, TWEAK, SIGHASH };
char const* str(tap);

}

/* BIP340 tagged hash with one of the BIP341 taproot tags.  */
Sha256::Hash tagged_hash( Tag::tap tag
			, void const* input
			, std::size_t size
			);

}

#endif /* !defined(SECP256K1_TAGGED_HASHES_HPP) */
