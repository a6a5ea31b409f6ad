#ifndef BITCOIN_TXIN_HPP
#define BITCOIN_TXIN_HPP

#include<cstdint>
#include<iostream>
#include<vector>
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/WitnessField.hpp"

namespace Bitcoin {

/** struct Bitcoin::TxIn
 *
 * @brief represents a Bitcoin transaction input.
 *
 * @desc The stream operators cover the outpoint,
 * `scriptSig` and `nSequence` only; the witness is
 * written separately by `Bitcoin::Tx`.
 */
struct TxIn {
	Bitcoin::TxId prevTxid;
	std::uint32_t prevOut;
	std::vector<std::uint8_t> scriptSig;
	std::uint32_t nSequence;
	Bitcoin::WitnessField witness;

	TxIn() : prevOut(0xFFFFFFFF), nSequence(0xFFFFFFFF) { }
	TxIn( Bitcoin::TxId prevTxid_
	    , std::uint32_t prevOut_
	    , std::uint32_t nSequence_ = 0xFFFFFFFF
	    ) : prevTxid(std::move(prevTxid_))
	      , prevOut(prevOut_)
	      , nSequence(nSequence_)
	      { }
	bool operator==(TxIn const& o) const {
		return prevTxid == o.prevTxid
		    && prevOut == o.prevOut
		    && scriptSig == o.scriptSig
		    && nSequence == o.nSequence
		    && witness == o.witness
		     ;
	}
	bool operator!=(TxIn const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Bitcoin::TxIn const&);
std::istream& operator>>(std::istream&, Bitcoin::TxIn&);

#endif /* !defined(BITCOIN_TXIN_HPP) */
