#ifndef ESCROW_ESCROWSTATE_HPP
#define ESCROW_ESCROWSTATE_HPP

#include"Escrow/Action.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Escrow { struct Vtxo; }

namespace Escrow {

enum EscrowStatus
{ Created
, Funded
, Executed
};
/* "created", "funded", "executed".  */
std::string to_string(EscrowStatus);

/** struct Escrow::EscrowState
 *
 * @brief what the Ark server knows of an escrow address.
 *
 * @desc `Created` until some output pays to it, `Executed`
 * once every such output is spent, `Funded` in between.
 */
struct EscrowState {
	EscrowStatus status;
	/* Sum of the unspent outputs.  */
	std::uint64_t balance;
	bool vtxo_exists;

	static EscrowState from_vtxos(std::vector<Vtxo> const&);

	bool operator==(EscrowState const& o) const {
		return status == o.status
		    && balance == o.balance
		    && vtxo_exists == o.vtxo_exists
		     ;
	}
};

/* The action labels to offer a party in the given state:
 * "Fund", "Release", "Refund" or "Direct Settle".
 */
std::vector<std::string> available_actions(EscrowState const&, Role);

}

#endif /* !defined(ESCROW_ESCROWSTATE_HPP) */
