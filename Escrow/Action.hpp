#ifndef ESCROW_ACTION_HPP
#define ESCROW_ACTION_HPP

#include<string>

namespace Escrow {

enum Role
{ Buyer
, Seller
, Arbitrator
, Server
};

enum Action
{ Fund
, Release
, Refund
, DirectSettle
};

/* "buyer", "seller", "arbitrator", "server".  */
std::string to_string(Role);
/* "fund", "release", "refund", "direct settle".  */
std::string to_string(Action);

/* Case-insensitive, surrounding whitespace ignored.
 * Return false if the text names nothing we know.
 */
bool parse_role(std::string const&, Role&);
bool parse_action(std::string const&, Action&);

}

#endif /* !defined(ESCROW_ACTION_HPP) */
