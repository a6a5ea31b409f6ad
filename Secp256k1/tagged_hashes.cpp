#include"Secp256k1/tagged_hashes.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/HasherStream.hpp"

namespace Secp256k1 {

namespace Tag {

namespace {

char const* const tags[] =
{ "TapLeaf"
, "TapBranch"
, "TapTweak"
, "TapSighash"
};

}

char const* str(tap t) {
	return tags[std::size_t(t)];
}

}

Sha256::Hash tagged_hash( Tag::tap tag
			, void const* input
			, std::size_t size
			) {
	Sha256::HasherStream hs(Tag::str(tag));
	hs.write((char const*) input, std::streamsize(size));
	return std::move(hs).finalize();
}

}
