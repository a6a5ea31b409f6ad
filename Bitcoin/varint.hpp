#ifndef BITCOIN_VARINT_HPP
#define BITCOIN_VARINT_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin { namespace Detail {

class VarInt {
private:
	std::uint64_t& v;
public:
	explicit VarInt(std::uint64_t& v_) : v(v_) { }
	friend std::istream& operator>>(std::istream&, VarInt);
};
class VarIntConst {
private:
	std::uint64_t v;
public:
	explicit VarIntConst(std::uint64_t v_) : v(v_) { }
	friend std::ostream& operator<<(std::ostream&, VarIntConst);
};

class VarBytes {
private:
	std::vector<std::uint8_t>& v;
public:
	explicit VarBytes(std::vector<std::uint8_t>& v_) : v(v_) { }
	friend std::istream& operator>>(std::istream&, VarBytes);
};
class VarBytesConst {
private:
	std::vector<std::uint8_t> const& v;
public:
	explicit VarBytesConst(std::vector<std::uint8_t> const& v_) : v(v_) { }
	friend std::ostream& operator<<(std::ostream&, VarBytesConst);
};

std::istream& operator>>(std::istream&, VarInt);
std::ostream& operator<<(std::ostream&, VarIntConst);
std::istream& operator>>(std::istream&, VarBytes);
std::ostream& operator<<(std::ostream&, VarBytesConst);

}}

namespace Bitcoin {

/** Bitcoin::varint
 *
 * @brief wraps a count so it is (de)serialized as a
 * Bitcoin `CompactSize` on C++ streams.
 */
inline
Detail::VarInt varint(std::uint64_t& v) {
	return Detail::VarInt(v);
}
inline
Detail::VarIntConst varint(std::uint64_t const& v) {
	return Detail::VarIntConst(v);
}

/** Bitcoin::varbytes
 *
 * @brief wraps a byte string so it is (de)serialized
 * with its length as a `CompactSize` prefix, as scripts
 * and witness items are.
 */
inline
Detail::VarBytes varbytes(std::vector<std::uint8_t>& v) {
	return Detail::VarBytes(v);
}
inline
Detail::VarBytesConst varbytes(std::vector<std::uint8_t> const& v) {
	return Detail::VarBytesConst(v);
}

}

#endif /* !defined(BITCOIN_VARINT_HPP) */
