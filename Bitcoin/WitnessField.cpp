#include"Bitcoin/WitnessField.hpp"
#include"Bitcoin/varint.hpp"

std::ostream& operator<<(std::ostream& os, Bitcoin::WitnessField const& v) {
	os << Bitcoin::varint(std::uint64_t(v.witnesses.size()));
	for (auto const& w : v.witnesses)
		os << Bitcoin::varbytes(w);
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::WitnessField& v) {
	auto count = std::uint64_t();
	is >> Bitcoin::varint(count);
	v.witnesses.clear();
	for (auto i = std::uint64_t(0); i < count && is; ++i) {
		v.witnesses.emplace_back();
		is >> Bitcoin::varbytes(v.witnesses.back());
	}
	return is;
}
