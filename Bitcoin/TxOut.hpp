#ifndef BITCOIN_TXOUT_HPP
#define BITCOIN_TXOUT_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin {

/** struct Bitcoin::TxOut
 *
 * @brief an output: an amount in satoshis and the
 * script that locks it.
 */
struct TxOut {
	std::uint64_t amount;
	std::vector<std::uint8_t> scriptPubKey;

	TxOut() : amount(0) { }
	TxOut( std::uint64_t amount_
	     , std::vector<std::uint8_t> scriptPubKey_
	     ) : amount(amount_)
	       , scriptPubKey(std::move(scriptPubKey_))
	       { }

	bool operator==(TxOut const& o) const {
		return amount == o.amount
		    && scriptPubKey == o.scriptPubKey
		     ;
	}
	bool operator!=(TxOut const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Bitcoin::TxOut const&);
std::istream& operator>>(std::istream&, Bitcoin::TxOut&);

#endif /* !defined(BITCOIN_TXOUT_HPP) */
