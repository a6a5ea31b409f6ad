#ifndef ESCROW_NETWORK_HPP
#define ESCROW_NETWORK_HPP

#include<string>

namespace Escrow {

enum Network
{ Mainnet
, Testnet
, Regtest
, Mutinynet
};

std::string to_string(Network);
bool parse_network(std::string const&, Network&);

/* Address prefix: "ark" on mainnet, "tark" elsewhere.  */
std::string ark_hrp(Network);

}

#endif /* !defined(ESCROW_NETWORK_HPP) */
