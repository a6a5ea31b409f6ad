#include"Escrow/Contract.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<stdexcept>

namespace Escrow {

std::string to_string(PendingStatus s) {
	switch (s) {
	case PendingCosign: return "pending_cosign";
	case Approved: return "approved";
	case Rejected: return "rejected";
	}
	return "unknown";
}
bool parse_pending_status(std::string const& s, PendingStatus& st) {
	auto t = Util::Str::tolower(Util::Str::trim(s));
	if (t == "pending_cosign")
		st = PendingCosign;
	else if (t == "approved")
		st = Approved;
	else if (t == "rejected")
		st = Rejected;
	else
		return false;
	return true;
}

bool contains(KeyList const& l, Secp256k1::XonlyPubKey const& k) {
	return std::find(l.begin(), l.end(), k) != l.end();
}

bool PendingTransaction::fully_approved() const {
	auto const& ptx = partial_tx;
	if (!contains(ptx.approvals, initiator))
		return false;
	for (auto const& k : ptx.required_signers)
		if (!contains(ptx.approvals, k))
			return false;
	return true;
}

bool Contract::role_of(Secp256k1::XonlyPubKey const& k, Role& r) const {
	if (k == buyer.pubkey)
		r = Buyer;
	else if (k == seller.pubkey)
		r = Seller;
	else if (k == arbitrator.pubkey)
		r = Arbitrator;
	else
		return false;
	return true;
}

Party const& Contract::party(Role r) const {
	switch (r) {
	case Buyer: return buyer;
	case Seller: return seller;
	case Arbitrator: return arbitrator;
	case Server: break;
	}
	throw std::invalid_argument("Escrow::Contract: server is not a party");
}

EscrowOptions Contract::options( Secp256k1::XonlyPubKey const& server
			       , RelativeTimelock const& delay
			       ) const {
	return EscrowOptions{ buyer.pubkey.to_bytes()
			    , seller.pubkey.to_bytes()
			    , arbitrator.pubkey.to_bytes()
			    , server.to_bytes()
			    , delay
			    };
}

bool Contract::operator==(Contract const& o) const {
	if (!!pending != !!o.pending)
		return false;
	if (pending && *pending != *o.pending)
		return false;
	return address == o.address
	    && buyer == o.buyer
	    && seller == o.seller
	    && arbitrator == o.arbitrator
	    && description == o.description
	    && created_at == o.created_at
	     ;
}

}
