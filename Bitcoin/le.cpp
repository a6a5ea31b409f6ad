#include"Bitcoin/le.hpp"

namespace Bitcoin { namespace Detail {

void put_le(std::ostream& os, std::uint64_t v, std::size_t bytes) {
	for (auto i = std::size_t(0); i < bytes; ++i)
		os.put(char((v >> (8 * i)) & 0xFF));
}
/* `get`, not `>>`, which would skip bytes that look like
 * whitespace.
 */
std::uint64_t get_le(std::istream& is, std::size_t bytes) {
	auto v = std::uint64_t(0);
	for (auto i = std::size_t(0); i < bytes; ++i)
		v |= std::uint64_t(std::uint8_t(is.get())) << (8 * i);
	return v;
}

}}
