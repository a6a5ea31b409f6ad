#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

enum Encoding
{ Invalid
, Bech32
, Bech32m
};

/** Util::Bech32::encode
 *
 * @brief encode an hrp and 5-bit groups into a bech32
 * or bech32m string.
 *
 * @desc The result is all-lowercase.  No length limit is
 * imposed, since Ark addresses exceed the 90 characters
 * BIP173 allows for segwit addresses.
 */
std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& data5
		  , Encoding enc = Bech32m
		  );

/** Util::Bech32::decode
 *
 * @brief decode and verify a bech32 or bech32m string.
 *
 * @return the encoding whose checksum matched, or
 * `Invalid` if the string is malformed, mixes cases,
 * or fails the checksum.
 */
Encoding decode( std::string& hrp
	       , std::vector<std::uint8_t>& data5
	       , std::string const& bech32
	       );

/** Util::Bech32::convertbits
 *
 * @brief regroup a sequence of `frombits`-bit values into
 * `tobits`-bit values.
 *
 * @return false if the input contains out-of-range values,
 * or, when `pad` is false, has non-zero leftover bits.
 */
bool convertbits( std::vector<std::uint8_t>& out
		, std::vector<std::uint8_t> const& in
		, int frombits, int tobits
		, bool pad
		);

}}

#endif /* !defined(UTIL_BECH32_HPP) */
