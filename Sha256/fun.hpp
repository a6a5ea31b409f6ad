#ifndef SHA256_FUN_HPP
#define SHA256_FUN_HPP

#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"

namespace Sha256 {

inline
Sha256::Hash fun(void const* p, std::size_t len) {
	auto hasher = Sha256::Hasher();
	hasher.feed(p, len);
	return std::move(hasher).finalize();
}
/* Second round of double-SHA256, as for txids.  */
inline
Sha256::Hash fun(Sha256::Hash const& h) {
	std::uint8_t buf[32];
	h.to_buffer(buf);
	return fun(buf, sizeof(buf));
}

}

#endif /* !defined(SHA256_FUN_HPP) */
