#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/make_unique.hpp"
#include<sodium/crypto_hash_sha256.h>
#include<sodium/utils.h>

namespace Sha256 {

class Hasher::Impl {
public:
	crypto_hash_sha256_state s;

	Impl() {
		crypto_hash_sha256_init(&s);
	}
	~Impl() {
		sodium_memzero(&s, sizeof(s));
	}

	void feed(void const* p, std::size_t len) {
		crypto_hash_sha256_update( &s
					 , (unsigned char const*) p
					 , (unsigned long long) len
					 );
	}
};

Hasher::Hasher() : pimpl(Util::make_unique<Impl>()) { }
Hasher::Hasher(std::string const& tag) : pimpl(Util::make_unique<Impl>()) {
	unsigned char th[crypto_hash_sha256_BYTES];
	crypto_hash_sha256( th
			  , (unsigned char const*) tag.data()
			  , (unsigned long long) tag.size()
			  );
	pimpl->feed(th, sizeof(th));
	pimpl->feed(th, sizeof(th));
}
Hasher::Hasher(Hasher&&) =default;
Hasher& Hasher::operator=(Hasher&&) =default;
Hasher::~Hasher() =default;

void Hasher::feed(void const* p, std::size_t len) {
	pimpl->feed(p, len);
}

Sha256::Hash Hasher::finalize()&& {
	std::uint8_t buff[crypto_hash_sha256_BYTES];
	crypto_hash_sha256_final(&pimpl->s, buff);
	pimpl = nullptr;
	return Sha256::Hash(buff);
}

}
