#include"Escrow/Authorizer.hpp"
#include<algorithm>

namespace Escrow { namespace Authorizer {

namespace {

/* Who may start each action.  */
std::vector<Role> eligible(Action action) {
	switch (action) {
	case Fund: return {Buyer};
	case Release: return {Seller, Arbitrator};
	case Refund: return {Buyer, Arbitrator};
	case DirectSettle: return {Buyer, Seller};
	}
	return {};
}

}

bool may_initiate(Action action, Role initiator) {
	auto e = eligible(action);
	return std::find(e.begin(), e.end(), initiator) != e.end();
}

std::vector<Role> required_signers(Action action, Role initiator) {
	if (!may_initiate(action, initiator))
		return {};
	/* Whoever may initiate must also sign.  */
	return eligible(action);
}

std::vector<Role> required_signers( std::string const& action
				  , Role initiator
				  ) {
	auto a = Action();
	if (!parse_action(action, a))
		return {};
	return required_signers(a, initiator);
}

}}
