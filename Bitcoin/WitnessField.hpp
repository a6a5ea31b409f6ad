#ifndef BITCOIN_WITNESSFIELD_HPP
#define BITCOIN_WITNESSFIELD_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin {

/** struct Bitcoin::WitnessField
 *
 * @brief represents the witness field of a
 * particular `TxIn`.
 *
 * @desc Index [0] is the stack bottom.
 * A tapscript spend puts the signatures first,
 * then the script, then the control block.
 */
struct WitnessField {
	std::vector<std::vector<std::uint8_t>> witnesses;

	bool empty() const {
		return witnesses.empty();
	}
	bool operator==(WitnessField const& o) const {
		return witnesses == o.witnesses;
	}
	bool operator!=(WitnessField const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Bitcoin::WitnessField const&);
std::istream& operator>>(std::istream&, Bitcoin::WitnessField&);

#endif /* !defined(BITCOIN_WITNESSFIELD_HPP) */
