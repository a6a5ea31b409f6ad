#ifndef BITCOIN_TXID_HPP
#define BITCOIN_TXID_HPP

#include"Sha256/Hash.hpp"
#include<iostream>
#include<string>

namespace Bitcoin {

/** class Bitcoin::TxId
 *
 * @brief double-SHA256 of the non-witness serialization
 * of a transaction.
 *
 * @desc The hex form is byte-reversed relative to the
 * hash, as explorers and the Ark indexer show it.
 * The binary stream form is the hash order used inside
 * transactions.
 */
class TxId;
}

/* NOTE: These output in binary.  */
std::ostream& operator<<(std::ostream&, Bitcoin::TxId const&);
std::istream& operator>>(std::istream&, Bitcoin::TxId&);

namespace Bitcoin {

class TxId {
private:
	/* Display order, i.e. the hash reversed.  */
	Sha256::Hash hash;

	friend
	std::ostream& ::operator<<(std::ostream&, Bitcoin::TxId const&);
	friend
	std::istream& ::operator>>(std::istream&, Bitcoin::TxId&);
public:
	TxId() =default;

	/* 64 hex digits as an explorer shows them.  */
	explicit
	TxId(std::string const& s);
	/* From the double-SHA256 output.  */
	explicit
	TxId(Sha256::Hash const& digest);

	explicit
	operator std::string() const;

	bool operator==(Bitcoin::TxId const& o) const {
		return hash == o.hash;
	}
	bool operator!=(Bitcoin::TxId const& o) const {
		return hash != o.hash;
	}
	bool operator<(Bitcoin::TxId const& o) const {
		return hash < o.hash;
	}
};

}

#endif /* !defined(BITCOIN_TXID_HPP) */
