#ifndef ESCROW_DETAIL_PAYOUT_HPP
#define ESCROW_DETAIL_PAYOUT_HPP

#include"Bitcoin/TxOut.hpp"
#include"Escrow/Action.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Escrow { struct Contract; }

namespace Escrow { namespace Detail {

/* The script paying a party's address.  An Ark address is
 * expected; a raw hex script is also accepted.
 */
std::vector<std::uint8_t> payout_script(std::string const& address);

/** Escrow::Detail::action_outputs
 *
 * @brief where an action sends the escrowed amount.
 *
 * @desc Release pays the seller and refund the buyer.
 * Direct settle gives the buyer `amount / 2` rounded down
 * and the seller the rest, so the outputs always sum to
 * `amount`.
 * Fund spends nothing and has no outputs.
 */
std::vector<Bitcoin::TxOut>
action_outputs( Escrow::Contract const& c
	      , Escrow::Action a
	      , std::uint64_t amount
	      );

}}

#endif /* !defined(ESCROW_DETAIL_PAYOUT_HPP) */
