#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<memory>
#include<string>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief incremental SHA-256 over libsodium.
 *
 * @desc A hasher built with a tag starts out having
 * absorbed `SHA256(tag) || SHA256(tag)`, so its result
 * is the BIP340 tagged hash of the bytes fed after.
 *
 * `finalize` consumes the hasher.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	explicit Hasher(std::string const& tag);
	Hasher(Hasher&&);
	Hasher& operator=(Hasher&&);
	~Hasher();

	void feed(void const* p, std::size_t size);

	Sha256::Hash finalize()&&;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
