#ifndef ESCROW_AUTHORIZER_HPP
#define ESCROW_AUTHORIZER_HPP

#include"Escrow/Action.hpp"
#include<string>
#include<vector>

namespace Escrow {

/** Escrow::Authorizer
 *
 * @brief decides who may start an action and whose
 * signatures it then needs.
 *
 * @desc An empty result means the initiator may not start
 * the action; the coordinator reports that as
 * Escrow::NotAuthorized.
 * Funding is a plain transfer, so a buyer asking to fund
 * gets back only the buyer.
 */
namespace Authorizer {

std::vector<Role> required_signers(Action action, Role initiator);
/* Unknown action names give an empty result.  */
std::vector<Role> required_signers( std::string const& action
				  , Role initiator
				  );

bool may_initiate(Action action, Role initiator);

}

}

#endif /* !defined(ESCROW_AUTHORIZER_HPP) */
