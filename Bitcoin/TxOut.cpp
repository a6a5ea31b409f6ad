#include"Bitcoin/TxOut.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

std::ostream& operator<<(std::ostream& os, Bitcoin::TxOut const& v) {
	return os << Bitcoin::le(v.amount) << Bitcoin::varbytes(v.scriptPubKey);
}
std::istream& operator>>(std::istream& is, Bitcoin::TxOut& v) {
	return is >> Bitcoin::le(v.amount) >> Bitcoin::varbytes(v.scriptPubKey);
}
