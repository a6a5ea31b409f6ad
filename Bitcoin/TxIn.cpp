#include"Bitcoin/TxIn.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

std::ostream& operator<<(std::ostream& os, Bitcoin::TxIn const& v) {
	return os << v.prevTxid
		  << Bitcoin::le(v.prevOut)
		  << Bitcoin::varbytes(v.scriptSig)
		  << Bitcoin::le(v.nSequence)
		   ;
}
std::istream& operator>>(std::istream& is, Bitcoin::TxIn& v) {
	return is >> v.prevTxid
		  >> Bitcoin::le(v.prevOut)
		  >> Bitcoin::varbytes(v.scriptSig)
		  >> Bitcoin::le(v.nSequence)
		   ;
}
