#ifndef BITCOIN_LE_HPP
#define BITCOIN_LE_HPP

#include<cstddef>
#include<cstdint>
#include<iostream>
#include<type_traits>

namespace Bitcoin { namespace Detail {

void put_le(std::ostream&, std::uint64_t v, std::size_t bytes);
std::uint64_t get_le(std::istream&, std::size_t bytes);

template<typename T>
class LeConst {
private:
	typedef typename std::make_unsigned<T>::type U;
	U v;

public:
	explicit LeConst(T v_) : v(U(v_)) { }

	friend
	std::ostream& operator<<(std::ostream& os, LeConst o) {
		put_le(os, std::uint64_t(o.v), sizeof(U));
		return os;
	}
};

template<typename T>
class Le {
private:
	typedef typename std::make_unsigned<T>::type U;
	T& v;

public:
	explicit Le(T& v_) : v(v_) { }

	friend
	std::ostream& operator<<(std::ostream& os, Le o) {
		return os << LeConst<T>(o.v);
	}
	friend
	std::istream& operator>>(std::istream& is, Le o) {
		o.v = T(U(get_le(is, sizeof(U))));
		return is;
	}
};

}}

namespace Bitcoin {

/** Bitcoin::le
 *
 * @brief wraps a fixed-width integer so that it is
 * (de)serialized little-endian on C++ streams, as
 * transaction fields are.
 *
 *     os << Bitcoin::le(tx.nLockTime);
 *     is >> Bitcoin::le(in.prevOut);
 */
template<typename T>
Detail::Le<T> le(T& v) {
	return Detail::Le<T>(v);
}
template<typename T>
Detail::LeConst<T> le(T const& v) {
	return Detail::LeConst<T>(v);
}

}

#endif /* !defined(BITCOIN_LE_HPP) */
