#include"Escrow/Network.hpp"
#include"Util/Str.hpp"

namespace Escrow {

std::string to_string(Network n) {
	switch (n) {
	case Mainnet: return "mainnet";
	case Testnet: return "testnet";
	case Regtest: return "regtest";
	case Mutinynet: return "mutinynet";
	}
	return "unknown";
}

bool parse_network(std::string const& s, Network& n) {
	auto t = Util::Str::tolower(Util::Str::trim(s));
	if (t == "mainnet" || t == "bitcoin")
		n = Mainnet;
	else if (t == "testnet")
		n = Testnet;
	else if (t == "regtest")
		n = Regtest;
	else if (t == "mutinynet" || t == "signet")
		n = Mutinynet;
	else
		return false;
	return true;
}

std::string ark_hrp(Network n) {
	return n == Mainnet ? "ark" : "tark";
}

}
