#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/SchnorrSig.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include<secp256k1.h>
#include<secp256k1_extrakeys.h>
#include<secp256k1_schnorrsig.h>
#include<sodium/randombytes.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

SchnorrSig::SchnorrSig(std::uint8_t const buffer[64]) {
	memcpy(data, buffer, 64);
}

SchnorrSig::SchnorrSig( Secp256k1::PrivKey const& sk
		      , Sha256::Hash const& m
		      ) {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);
	std::uint8_t skbuf[32];
	sk.to_buffer(skbuf);
	std::uint8_t aux[32];
	randombytes_buf(aux, sizeof(aux));

	secp256k1_keypair kp;
	auto res = secp256k1_keypair_create(context(), &kp, skbuf);
	sodium_memzero(skbuf, sizeof(skbuf));
	if (!res)
		throw InvalidPrivKey();

	res = secp256k1_schnorrsig_sign32(context(), data, mbuf, &kp, aux);
	sodium_memzero(&kp, sizeof(kp));
	if (!res)
		throw InvalidPrivKey();
}

SchnorrSig::SchnorrSig() {
	memset(data, 0, 64);
}

bool SchnorrSig::valid( Secp256k1::XonlyPubKey const& pk
		      , Sha256::Hash const& m
		      ) const {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);
	auto res = secp256k1_schnorrsig_verify
		( context()
		, data
		, mbuf
		, sizeof(mbuf)
		, reinterpret_cast<secp256k1_xonly_pubkey const*>(pk.get_key())
		);
	return res != 0;
}

void SchnorrSig::to_buffer(std::uint8_t buffer[64]) const {
	memcpy(buffer, data, 64);
}
std::vector<std::uint8_t> SchnorrSig::to_bytes() const {
	return std::vector<std::uint8_t>(data, data + 64);
}

}
