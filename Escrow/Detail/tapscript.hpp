#ifndef ESCROW_DETAIL_TAPSCRIPT_HPP
#define ESCROW_DETAIL_TAPSCRIPT_HPP

#include"Secp256k1/XonlyPubKey.hpp"
#include<cstdint>
#include<vector>

namespace Escrow { struct RelativeTimelock; }

namespace Escrow { namespace Detail {

/* OP_0, OP_1 to OP_16, OP_1NEGATE, or a minimal
 * script-number push.
 */
std::vector<std::uint8_t> encode_number(std::int64_t);

/* <k1> CHECKSIGVERIFY ... <kn> CHECKSIG, in the given order.  */
std::vector<std::uint8_t>
multisig_script(std::vector<Secp256k1::XonlyPubKey> const& keys);

/* <sequence> CHECKSEQUENCEVERIFY DROP, then the multisig.  */
std::vector<std::uint8_t>
csv_multisig_script( std::vector<Secp256k1::XonlyPubKey> const& keys
		   , Escrow::RelativeTimelock const& timelock
		   );

/** struct Escrow::Detail::ParsedScript
 *
 * @brief the parts of a script built by `multisig_script`
 * or `csv_multisig_script`.
 */
struct ParsedScript {
	bool has_csv;
	std::uint32_t sequence;
	std::vector<Secp256k1::XonlyPubKey> keys;
};

/* Return false if the script is not one of our two shapes.  */
bool parse_script( ParsedScript& out
		 , std::vector<std::uint8_t> const& script
		 );

}}

#endif /* !defined(ESCROW_DETAIL_TAPSCRIPT_HPP) */
