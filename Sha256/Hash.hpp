#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA-256 digest, held by value.
 * A default-constructed hash is all zeroes.
 *
 * @desc Ordering compares the bytes in buffer order,
 * which is the order taproot uses to sort branches.
 */
class Hash {
private:
	std::uint8_t d[32];

public:
	Hash();
	explicit Hash(std::uint8_t const buffer[32]);
	/* From 64 hex digits, in buffer order.  Throws
	 * std::invalid_argument otherwise.
	 */
	explicit Hash(std::string const&);

	explicit operator std::string() const;

	/* False if all zeroes.  */
	explicit operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& o) const {
		return !(*this == o);
	}
	bool operator<(Hash const&) const;

	void to_buffer(std::uint8_t buffer[32]) const;
	void from_buffer(std::uint8_t const buffer[32]);
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& h) {
	return os << std::string(h);
}

}

#endif /* !defined(SHA256_HASH_HPP) */
