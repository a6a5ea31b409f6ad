#undef NDEBUG
#include"Bitcoin/TxId.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/EscrowState.hpp"
#include"Util/Str.hpp"
#include<assert.h>

namespace {

typedef std::vector<std::string> Labels;

Escrow::Vtxo vtxo(unsigned n, std::uint64_t value, std::string spent_by = "") {
	return Escrow::Vtxo{ Bitcoin::TxId(Util::Str::fmt("%064x", n))
			   , 0, value, std::move(spent_by)
			   };
}

}

int main() {
	using Escrow::EscrowState;
	using Escrow::available_actions;

	auto created = EscrowState::from_vtxos({});
	assert(created.status == Escrow::Created);
	assert(created.balance == 0);
	assert(!created.vtxo_exists);
	assert(to_string(created.status) == "created");

	auto funded = EscrowState::from_vtxos({vtxo(1, 5000), vtxo(2, 700)});
	assert(funded.status == Escrow::Funded);
	assert(funded.balance == 5700);
	assert(funded.vtxo_exists);

	/* Spent outputs do not count toward the balance.  */
	auto partly = EscrowState::from_vtxos({vtxo(1, 5000, "ab"), vtxo(2, 700)});
	assert(partly.status == Escrow::Funded);
	assert(partly.balance == 700);

	auto executed = EscrowState::from_vtxos({vtxo(1, 5000, "ab"), vtxo(2, 700, "cd")});
	assert(executed.status == Escrow::Executed);
	assert(executed.balance == 0);
	assert(executed.vtxo_exists);
	assert(to_string(executed.status) == "executed");

	/* Before funding, only the buyer has anything to do.  */
	assert(available_actions(created, Escrow::Buyer) == Labels{"Fund"});
	assert(available_actions(created, Escrow::Seller).empty());
	assert(available_actions(created, Escrow::Arbitrator).empty());
	assert(available_actions(created, Escrow::Server).empty());

	assert((available_actions(funded, Escrow::Buyer) == Labels{"Refund", "Direct Settle"}));
	assert((available_actions(funded, Escrow::Seller) == Labels{"Release", "Direct Settle"}));
	assert((available_actions(funded, Escrow::Arbitrator) == Labels{"Release", "Refund"}));
	assert(available_actions(funded, Escrow::Server).empty());

	/* The labels parse back to the actions they name.  */
	for (auto const& l : available_actions(funded, Escrow::Buyer)) {
		auto a = Escrow::Action();
		assert(Escrow::parse_action(l, a));
	}

	return 0;
}
