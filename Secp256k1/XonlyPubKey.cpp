#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<secp256k1.h>
#include<secp256k1_extrakeys.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

class XonlyPubKey::Impl {
public:
	secp256k1_xonly_pubkey key;
	/* Serialized form, cached for comparisons.  */
	std::uint8_t ser[32];

	void parse(std::uint8_t const buffer[32]) {
		if (!secp256k1_xonly_pubkey_parse(context(), &key, buffer))
			throw InvalidPubKey();
		memcpy(ser, buffer, 32);
	}
	void load(secp256k1_xonly_pubkey const& k) {
		key = k;
		secp256k1_xonly_pubkey_serialize(context(), ser, &key);
	}
};

XonlyPubKey::XonlyPubKey() : pimpl(Util::make_unique<Impl>()) { }

XonlyPubKey::XonlyPubKey(std::string const& s)
	: pimpl(Util::make_unique<Impl>()) {
	if (s.size() != 64 || !Util::Str::ishex(s))
		throw InvalidPubKey();
	auto buf = Util::Str::hexread(s);
	pimpl->parse(&buf[0]);
}
XonlyPubKey::operator std::string() const {
	return Util::Str::hexdump(pimpl->ser, 32);
}

XonlyPubKey::XonlyPubKey(Secp256k1::PrivKey const& sk)
	: pimpl(Util::make_unique<Impl>()) {
	std::uint8_t skbuf[32];
	sk.to_buffer(skbuf);
	secp256k1_keypair kp;
	auto res = secp256k1_keypair_create(context(), &kp, skbuf);
	sodium_memzero(skbuf, sizeof(skbuf));
	if (!res)
		throw InvalidPrivKey();
	secp256k1_xonly_pubkey xk;
	secp256k1_keypair_xonly_pub(context(), &xk, nullptr, &kp);
	sodium_memzero(&kp, sizeof(kp));
	pimpl->load(xk);
}

XonlyPubKey::XonlyPubKey(XonlyPubKey const& o)
	: pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
XonlyPubKey::XonlyPubKey(XonlyPubKey&& o)
	: pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
XonlyPubKey& XonlyPubKey::operator=(XonlyPubKey const& o) {
	*pimpl = *o.pimpl;
	return *this;
}
XonlyPubKey& XonlyPubKey::operator=(XonlyPubKey&& o) {
	*pimpl = *o.pimpl;
	return *this;
}
XonlyPubKey::~XonlyPubKey() { }

XonlyPubKey XonlyPubKey::from_buffer(std::uint8_t const buffer[32]) {
	auto rv = XonlyPubKey();
	rv.pimpl->parse(buffer);
	return rv;
}
XonlyPubKey XonlyPubKey::from_bytes(std::vector<std::uint8_t> const& b) {
	if (b.size() != 32)
		throw InvalidPubKey();
	return from_buffer(&b[0]);
}
XonlyPubKey XonlyPubKey::from_compressed(std::vector<std::uint8_t> const& b) {
	if (b.size() != 33 || (b[0] != 0x02 && b[0] != 0x03))
		throw InvalidPubKey();
	return from_buffer(&b[1]);
}

void const* XonlyPubKey::get_key() const {
	return &pimpl->key;
}

void XonlyPubKey::to_buffer(std::uint8_t buffer[32]) const {
	memcpy(buffer, pimpl->ser, 32);
}
std::vector<std::uint8_t> XonlyPubKey::to_bytes() const {
	return std::vector<std::uint8_t>(pimpl->ser, pimpl->ser + 32);
}

XonlyPubKey
XonlyPubKey::tweak_add(Sha256::Hash const& tweak, int& parity) const {
	std::uint8_t tbuf[32];
	tweak.to_buffer(tbuf);

	secp256k1_pubkey full;
	if (!secp256k1_xonly_pubkey_tweak_add( context()
					     , &full
					     , &pimpl->key
					     , tbuf
					     ))
		throw InvalidPubKey();

	secp256k1_xonly_pubkey xk;
	secp256k1_xonly_pubkey_from_pubkey(context(), &xk, &parity, &full);

	auto rv = XonlyPubKey();
	rv.pimpl->load(xk);
	return rv;
}

bool XonlyPubKey::operator==(XonlyPubKey const& o) const {
	return memcmp(pimpl->ser, o.pimpl->ser, 32) == 0;
}
bool XonlyPubKey::operator<(XonlyPubKey const& o) const {
	return memcmp(pimpl->ser, o.pimpl->ser, 32) < 0;
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::XonlyPubKey const& pk) {
	return os << std::string(pk);
}
