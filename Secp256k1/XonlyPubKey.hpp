#ifndef SECP256K1_XONLYPUBKEY_HPP
#define SECP256K1_XONLYPUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class SchnorrSig; }
namespace Secp256k1 { class XonlyPubKey; }
namespace Sha256 { class Hash; }

std::ostream& operator<<(std::ostream&, Secp256k1::XonlyPubKey const&);

namespace Secp256k1 {

/* Thrown in case of being fed an invalid public key.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey()
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid public key."
		  ) { }
};

/** class Secp256k1::XonlyPubKey
 *
 * @brief a BIP340 32-byte x-only public key.
 *
 * @desc Ordering and equality compare the serialized
 * 32 bytes, so keys can be used in sorted containers.
 */
class XonlyPubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	XonlyPubKey();

	/* Used by SchnorrSig::valid.  */
	void const* get_key() const;

public:
	/* Load from a 64-digit hex string.  */
	explicit XonlyPubKey(std::string const&);
	explicit operator std::string() const;
	/* The public key of the given private key.  */
	explicit XonlyPubKey(Secp256k1::PrivKey const&);

	XonlyPubKey(XonlyPubKey const&);
	XonlyPubKey(XonlyPubKey&&);
	XonlyPubKey& operator=(XonlyPubKey const&);
	XonlyPubKey& operator=(XonlyPubKey&&);
	~XonlyPubKey();

	static XonlyPubKey from_buffer(std::uint8_t const buffer[32]);
	static XonlyPubKey from_bytes(std::vector<std::uint8_t> const&);
	/* Drops the parity byte of a 33-byte compressed key.  */
	static XonlyPubKey from_compressed(std::vector<std::uint8_t> const&);

	void to_buffer(std::uint8_t buffer[32]) const;
	std::vector<std::uint8_t> to_bytes() const;

	/** Secp256k1::XonlyPubKey::tweak_add
	 *
	 * @brief computes `P + t*G`, returning the x-only result
	 * and setting `parity` to the parity of its y coordinate.
	 *
	 * @desc Throws `InvalidPubKey` if the tweak overflows
	 * the group order or the result is the point at infinity.
	 */
	XonlyPubKey tweak_add(Sha256::Hash const& tweak, int& parity) const;

	bool operator==(XonlyPubKey const&) const;
	bool operator!=(XonlyPubKey const& o) const {
		return !(*this == o);
	}
	bool operator<(XonlyPubKey const&) const;

	friend class Secp256k1::SchnorrSig;
};

}

namespace std {
template<>
struct hash<::Secp256k1::XonlyPubKey> {
	std::size_t operator()(::Secp256k1::XonlyPubKey const& k) const {
		std::uint8_t buf[32];
		k.to_buffer(buf);
		auto rv = std::size_t(0);
		for (auto i = 0; i < 8; ++i)
			rv = (rv << 8) | buf[i];
		return rv;
	}
};
}

#endif /* !defined(SECP256K1_XONLYPUBKEY_HPP) */
