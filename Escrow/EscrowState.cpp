#include"Escrow/Contract.hpp"
#include"Escrow/EscrowState.hpp"

namespace Escrow {

std::string to_string(EscrowStatus s) {
	switch (s) {
	case Created: return "created";
	case Funded: return "funded";
	case Executed: return "executed";
	}
	return "unknown";
}

EscrowState EscrowState::from_vtxos(std::vector<Vtxo> const& vtxos) {
	auto balance = std::uint64_t(0);
	auto all_spent = true;
	for (auto const& v : vtxos) {
		if (v.is_spent())
			continue;
		all_spent = false;
		balance += v.value;
	}
	auto status = vtxos.empty() ? Created
		    : all_spent ? Executed
		    : Funded
		    ;
	return EscrowState{status, balance, !vtxos.empty()};
}

std::vector<std::string> available_actions(EscrowState const& s, Role r) {
	auto rv = std::vector<std::string>();
	if (s.status == Created) {
		if (r == Buyer)
			rv.push_back("Fund");
		return rv;
	}
	switch (r) {
	case Buyer:
		rv.push_back("Refund");
		rv.push_back("Direct Settle");
		break;
	case Seller:
		rv.push_back("Release");
		rv.push_back("Direct Settle");
		break;
	case Arbitrator:
		rv.push_back("Release");
		rv.push_back("Refund");
		break;
	case Server:
		break;
	}
	return rv;
}

}
