#ifndef ESCROW_CONTRACT_HPP
#define ESCROW_CONTRACT_HPP

#include"Bitcoin/Psbt.hpp"
#include"Bitcoin/TxId.hpp"
#include"Escrow/Action.hpp"
#include"Escrow/Script.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Escrow {

/** struct Escrow::Party
 *
 * @brief a participant: a friendly name, the key they
 * sign with, and the Ark address their payouts go to.
 */
struct Party {
	std::string name;
	Secp256k1::XonlyPubKey pubkey;
	std::string address;
	/* Milliseconds since the epoch.  */
	std::uint64_t created_at;

	bool operator==(Party const& o) const {
		return name == o.name
		    && pubkey == o.pubkey
		    && address == o.address
		    && created_at == o.created_at
		     ;
	}
	bool operator!=(Party const& o) const { return !(*this == o); }
};

/* A virtual output.  `spent_by` is empty while unspent.  */
struct Vtxo {
	Bitcoin::TxId txid;
	std::uint32_t vout;
	std::uint64_t value;
	std::string spent_by;

	bool is_spent() const { return !spent_by.empty(); }

	bool operator==(Vtxo const& o) const {
		return txid == o.txid
		    && vout == o.vout
		    && value == o.value
		    && spent_by == o.spent_by
		     ;
	}
	bool operator!=(Vtxo const& o) const { return !(*this == o); }
};

enum PendingStatus
{ PendingCosign
, Approved
, Rejected
};
/* "pending_cosign", "approved", "rejected".  */
std::string to_string(PendingStatus);
bool parse_pending_status(std::string const&, PendingStatus&);

typedef std::vector<Secp256k1::XonlyPubKey> KeyList;

bool contains(KeyList const&, Secp256k1::XonlyPubKey const&);

/** struct Escrow::PartialTx
 *
 * @brief a spend of the escrow output and its checkpoints,
 * with the signatures collected so far.
 */
struct PartialTx {
	Vtxo vtxo;
	Bitcoin::Psbt spend_tx;
	std::vector<Bitcoin::Psbt> checkpoint_txs;
	/* Never includes the initiator.  */
	KeyList required_signers;
	/* Starts with the initiator.  */
	KeyList approvals;
	KeyList rejections;

	bool operator==(PartialTx const& o) const {
		return vtxo == o.vtxo
		    && spend_tx == o.spend_tx
		    && checkpoint_txs == o.checkpoint_txs
		    && required_signers == o.required_signers
		    && approvals == o.approvals
		    && rejections == o.rejections
		     ;
	}
	bool operator!=(PartialTx const& o) const { return !(*this == o); }
};

struct PendingTransaction {
	Action action;
	Secp256k1::XonlyPubKey initiator;
	std::uint64_t created_at;
	PendingStatus status;
	PartialTx partial_tx;

	/* Every required signer and the initiator have approved.  */
	bool fully_approved() const;

	bool operator==(PendingTransaction const& o) const {
		return action == o.action
		    && initiator == o.initiator
		    && created_at == o.created_at
		    && status == o.status
		    && partial_tx == o.partial_tx
		     ;
	}
	bool operator!=(PendingTransaction const& o) const {
		return !(*this == o);
	}
};

/** struct Escrow::Contract
 *
 * @brief one escrow, as stored and synchronized.
 *
 * @desc The pending transaction is shared and immutable;
 * changing it means installing a new one in a copy of the
 * contract.
 */
struct Contract {
	std::string address;
	Party buyer;
	Party seller;
	Party arbitrator;
	std::string description;
	std::uint64_t created_at;
	std::shared_ptr<PendingTransaction const> pending;

	/* Return false if the key is none of the three parties.  */
	bool role_of(Secp256k1::XonlyPubKey const&, Role&) const;
	bool involves(Secp256k1::XonlyPubKey const& k) const {
		auto r = Role();
		return role_of(k, r);
	}
	/* Throws std::invalid_argument for the server role.  */
	Party const& party(Role) const;

	EscrowOptions options( Secp256k1::XonlyPubKey const& server
			     , RelativeTimelock const& delay
			     ) const;

	bool operator==(Contract const& o) const;
	bool operator!=(Contract const& o) const { return !(*this == o); }
};

}

#endif /* !defined(ESCROW_CONTRACT_HPP) */
