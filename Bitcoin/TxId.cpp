#include"Bitcoin/TxId.hpp"
#include<algorithm>

namespace {

Sha256::Hash reversed(Sha256::Hash const& h) {
	std::uint8_t buf[32];
	h.to_buffer(buf);
	std::reverse(buf, buf + 32);
	return Sha256::Hash(buf);
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::TxId const& id) {
	std::uint8_t buf[32];
	reversed(id.hash).to_buffer(buf);
	return os.write((char const*) buf, sizeof(buf));
}
std::istream& operator>>(std::istream& is, Bitcoin::TxId& id) {
	std::uint8_t buf[32];
	is.read((char*) buf, sizeof(buf));
	id.hash = reversed(Sha256::Hash(buf));
	return is;
}

namespace Bitcoin {

TxId::TxId(std::string const& s) : hash(s) { }
TxId::TxId(Sha256::Hash const& digest) : hash(reversed(digest)) { }

TxId::operator std::string() const {
	return std::string(hash);
}

}
