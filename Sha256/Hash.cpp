#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sodium/utils.h>
#include<stdexcept>

namespace Sha256 {

Hash::Hash() {
	std::fill(d, d + 32, std::uint8_t(0));
}
Hash::Hash(std::uint8_t const buffer[32]) {
	from_buffer(buffer);
}
Hash::Hash(std::string const& s) {
	if (s.size() != 64 || !Util::Str::ishex(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Sha256::Hash: need 64 hex digits"
		);
	auto bytes = Util::Str::hexread(s);
	from_buffer(&bytes[0]);
}

Hash::operator std::string() const {
	return Util::Str::hexdump(d, 32);
}
Hash::operator bool() const {
	return !sodium_is_zero(d, 32);
}
bool Hash::operator==(Hash const& o) const {
	return sodium_memcmp(d, o.d, 32) == 0;
}
bool Hash::operator<(Hash const& o) const {
	return std::lexicographical_compare(d, d + 32, o.d, o.d + 32);
}

void Hash::to_buffer(std::uint8_t buffer[32]) const {
	std::copy(d, d + 32, buffer);
}
void Hash::from_buffer(std::uint8_t const buffer[32]) {
	std::copy(buffer, buffer + 32, d);
}

}
