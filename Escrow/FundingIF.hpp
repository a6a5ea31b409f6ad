#ifndef ESCROW_FUNDINGIF_HPP
#define ESCROW_FUNDINGIF_HPP

#include<string>

namespace Ev { template<typename a> class Io; }

namespace Escrow {

/* The buyer's wallet: pays into an escrow address and
 * returns the funding txid.
 */
class FundingIF {
public:
	virtual ~FundingIF() { }

	virtual
	Ev::Io<std::string> send_to_address(std::string address) =0;
};

}

#endif /* !defined(ESCROW_FUNDINGIF_HPP) */
