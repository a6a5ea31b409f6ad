#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

PrivKey::PrivKey(std::uint8_t const key_[32]) {
	if (!secp256k1_ec_seckey_verify(context(), key_))
		throw InvalidPrivKey();
	memcpy(key, key_, 32);
}

PrivKey::PrivKey() {
	memset(key, 0, 31);
	key[31] = 1;
}

PrivKey::PrivKey(std::string const& s) {
	auto buf = std::vector<std::uint8_t>();
	try {
		buf = Util::Str::hexread(s);
	} catch (Util::Str::HexParseFailure const&) {
		throw InvalidPrivKey();
	}
	if (buf.size() != 32)
		throw InvalidPrivKey();
	if (!secp256k1_ec_seckey_verify(context(), &buf[0]))
		throw InvalidPrivKey();
	memcpy(key, &buf[0], 32);
	sodium_memzero(&buf[0], buf.size());
}
PrivKey::operator std::string() const {
	return Util::Str::hexdump(key, sizeof(key));
}

PrivKey::PrivKey(PrivKey const& o) {
	memcpy(key, o.key, 32);
}
PrivKey& PrivKey::operator=(PrivKey const& o) {
	memcpy(key, o.key, 32);
	return *this;
}

PrivKey::~PrivKey() {
	sodium_memzero(key, sizeof(key));
}

bool PrivKey::operator==(PrivKey const& o) const {
	return 0 == sodium_memcmp(key, o.key, sizeof(key));
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::PrivKey const& sk) {
	return os << std::string(sk);
}
