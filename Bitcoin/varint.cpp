#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

namespace Bitcoin { namespace Detail {

std::ostream& operator<<(std::ostream& os, VarIntConst o) {
	if (o.v < 0xFD) {
		os.put(char(o.v));
	} else if (o.v <= 0xFFFF) {
		os.put(char(0xFD));
		put_le(os, o.v, 2);
	} else if (o.v <= 0xFFFFFFFF) {
		os.put(char(0xFE));
		put_le(os, o.v, 4);
	} else {
		os.put(char(0xFF));
		put_le(os, o.v, 8);
	}
	return os;
}
std::istream& operator>>(std::istream& is, VarInt o) {
	auto t = std::uint8_t(is.get());
	if (t < 0xFD)
		o.v = t;
	else if (t == 0xFD)
		o.v = get_le(is, 2);
	else if (t == 0xFE)
		o.v = get_le(is, 4);
	else
		o.v = get_le(is, 8);
	return is;
}

std::ostream& operator<<(std::ostream& os, VarBytesConst o) {
	os << varint(std::uint64_t(o.v.size()));
	return os.write((char const*) o.v.data(), std::streamsize(o.v.size()));
}
std::istream& operator>>(std::istream& is, VarBytes o) {
	auto len = std::uint64_t();
	is >> varint(len);
	if (!is)
		return is;
	/* Do not trust a huge length from a short stream.  */
	o.v.clear();
	for (auto i = std::uint64_t(0); i < len; ++i) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof())
			break;
		o.v.push_back(std::uint8_t(c));
	}
	return is;
}

}}
