#include"Escrow/Action.hpp"
#include"Util/Str.hpp"

namespace Escrow {

std::string to_string(Role r) {
	switch (r) {
	case Buyer: return "buyer";
	case Seller: return "seller";
	case Arbitrator: return "arbitrator";
	case Server: return "server";
	}
	return "unknown";
}
std::string to_string(Action a) {
	switch (a) {
	case Fund: return "fund";
	case Release: return "release";
	case Refund: return "refund";
	case DirectSettle: return "direct settle";
	}
	return "unknown";
}

bool parse_role(std::string const& s, Role& r) {
	auto t = Util::Str::tolower(Util::Str::trim(s));
	if (t == "buyer")
		r = Buyer;
	else if (t == "seller")
		r = Seller;
	else if (t == "arbitrator")
		r = Arbitrator;
	else if (t == "server")
		r = Server;
	else
		return false;
	return true;
}
bool parse_action(std::string const& s, Action& a) {
	auto t = Util::Str::tolower(Util::Str::trim(s));
	if (t == "fund")
		a = Fund;
	else if (t == "release")
		a = Release;
	else if (t == "refund")
		a = Refund;
	else if (t == "direct settle")
		a = DirectSettle;
	else
		return false;
	return true;
}

}
