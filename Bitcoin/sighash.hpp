#ifndef BITCOIN_SIGHASH_HPP
#define BITCOIN_SIGHASH_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Bitcoin { struct Tx; }
namespace Bitcoin { struct TxOut; }
namespace Sha256 { class Hash; }

namespace Bitcoin {

enum SighashFlags
{ SIGHASH_DEFAULT = 0 /* taproot only */
, SIGHASH_ALL = 1
, SIGHASH_NONE = 2
, SIGHASH_SINGLE = 3
, SIGHASH_ANYONECANPAY = 0x80
};

/* BIP341 `spend_type` is `ext_flag * 2 + annex_present`.
 * Annexes are not supported.
 */
enum p2trSpendType
{ KEYPATH = 0
, SCRIPTPATH = 2
};

struct InvalidSighash : public Util::BacktraceException<std::invalid_argument> {
	InvalidSighash() =delete;
	InvalidSighash(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			std::string("Bitcoin::InvalidSighash: ") + msg
		  ) { }
};

/** Bitcoin::p2tr_sighash
 *
 * @brief computes the BIP341 signature message hash for
 * a key-path spend of input `nIn`.
 *
 * @desc `prevouts` lists the amount and `scriptPubKey` of
 * every output being spent, in input order.
 *
 * Throws `Bitcoin::InvalidSighash` for unknown flags,
 * an out-of-range `nIn`, a `prevouts` list that does not
 * match the inputs, or `SIGHASH_SINGLE` with no
 * corresponding output.
 */
Sha256::Hash
p2tr_sighash( Bitcoin::Tx const& tx
	    , SighashFlags flags
	    , std::uint32_t nIn
	    , std::vector<Bitcoin::TxOut> const& prevouts
	    );

/** Bitcoin::p2tr_script_sighash
 *
 * @brief as `p2tr_sighash`, for a script-path spend
 * through the leaf with the given tapleaf hash.
 *
 * @desc Appends the BIP342 extension: the leaf hash,
 * key version 0, and no executed `OP_CODESEPARATOR`.
 */
Sha256::Hash
p2tr_script_sighash( Bitcoin::Tx const& tx
		   , SighashFlags flags
		   , std::uint32_t nIn
		   , std::vector<Bitcoin::TxOut> const& prevouts
		   , Sha256::Hash const& tapleaf_hash
		   );

}

#endif /* !defined(BITCOIN_SIGHASH_HPP) */
