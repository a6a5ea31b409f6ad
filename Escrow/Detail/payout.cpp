#include"Escrow/ArkAddress.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/Detail/payout.hpp"
#include"Escrow/Error.hpp"
#include"Util/Str.hpp"

namespace Escrow { namespace Detail {

std::vector<std::uint8_t> payout_script(std::string const& address) {
	try {
		return ArkAddress::decode(address).pk_script();
	} catch (InvalidAddress const&) {
		if (!Util::Str::ishex(address))
			throw;
		return Util::Str::hexread(address);
	}
}

std::vector<Bitcoin::TxOut>
action_outputs( Escrow::Contract const& c
	      , Escrow::Action a
	      , std::uint64_t amount
	      ) {
	auto rv = std::vector<Bitcoin::TxOut>();
	switch (a) {
	case Release:
		rv.emplace_back(amount, payout_script(c.seller.address));
		break;
	case Refund:
		rv.emplace_back(amount, payout_script(c.buyer.address));
		break;
	case DirectSettle: {
		auto half = amount / 2;
		rv.emplace_back(half, payout_script(c.buyer.address));
		rv.emplace_back(amount - half, payout_script(c.seller.address));
		break;
	}
	case Fund:
		break;
	}
	return rv;
}

}}
