#include"Bitcoin/Psbt.hpp"
#include"Escrow/ArkAddress.hpp"
#include"Escrow/Authorizer.hpp"
#include"Escrow/ChainQueryIF.hpp"
#include"Escrow/ChainSubmitIF.hpp"
#include"Escrow/ContractRegistry.hpp"
#include"Escrow/Coordinator.hpp"
#include"Escrow/Detail/payout.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/FundingIF.hpp"
#include"Escrow/OffchainTx.hpp"
#include"Escrow/Script.hpp"
#include"Escrow/Shutdown.hpp"
#include"Escrow/SignerIF.hpp"
#include"Escrow/TransportIF.hpp"
#include"Escrow/Waiter.hpp"
#include"Escrow/log.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<set>

namespace {

std::string hex(Secp256k1::XonlyPubKey const& k) {
	return std::string(k);
}

Escrow::Script::Path path_of(Escrow::Action a) {
	switch (a) {
	case Escrow::Release: return Escrow::Script::Release;
	case Escrow::Refund: return Escrow::Script::Refund;
	case Escrow::DirectSettle: return Escrow::Script::Direct;
	case Escrow::Fund: break;
	}
	throw std::invalid_argument("No spending path for " + to_string(a));
}

/* Merges what the signer adds into our copies, so a
 * signer can only ever add signatures.
 */
Ev::Io<void>
sign_checkpoints( Escrow::SignerIF& signer
		, std::shared_ptr<Escrow::PartialTx> ptx
		, std::size_t i
		) {
	if (i >= ptx->checkpoint_txs.size())
		return Ev::lift();
	return signer.sign(ptx->checkpoint_txs[i])
		.then([&signer, ptx, i](Bitcoin::Psbt signed_tx) {
		ptx->checkpoint_txs[i].merge_signatures(signed_tx);
		return sign_checkpoints(signer, ptx, i + 1);
	});
}
Ev::Io<void>
sign_partial( Escrow::SignerIF& signer
	    , std::shared_ptr<Escrow::PartialTx> ptx
	    ) {
	return signer.sign(ptx->spend_tx)
		.then([&signer, ptx](Bitcoin::Psbt signed_tx) {
		ptx->spend_tx.merge_signatures(signed_tx);
		return sign_checkpoints(signer, ptx, 0);
	});
}

}

namespace Escrow {

class Coordinator::Impl {
public:
	S::Bus& bus;
	ContractRegistry& registry;
	TransportIF& transport;
	ChainQueryIF& query;
	ChainSubmitIF& submitter;
	FundingIF& funding;
	Waiter& waiter;
	CoordinatorSettings settings;
	/* Contracts whose rejected transaction is waiting out
	 * the grace period here.  */
	std::set<std::string> clearing;

	Impl( S::Bus& bus_
	    , ContractRegistry& registry_
	    , TransportIF& transport_
	    , ChainQueryIF& query_
	    , ChainSubmitIF& submitter_
	    , FundingIF& funding_
	    , Waiter& waiter_
	    , CoordinatorSettings settings_
	    ) : bus(bus_)
	      , registry(registry_)
	      , transport(transport_)
	      , query(query_)
	      , submitter(submitter_)
	      , funding(funding_)
	      , waiter(waiter_)
	      , settings(std::move(settings_))
	      { }

	Script script(Contract const& c) const {
		return Script(c.options( settings.server
				       , settings.unilateral_delay
				       ));
	}

	Ev::Io<void> fund( std::shared_ptr<Contract> c
			 , Role role
			 , std::vector<Vtxo> const& vtxos
			 ) {
		if (!vtxos.empty())
			throw AlreadyFunded(c->address);
		if (!Authorizer::may_initiate(Fund, role))
			throw NotAuthorized(to_string(Fund), to_string(role));
		return funding.send_to_address(c->address)
			.then([this, c](std::string txid) {
			return log( bus, Info
				  , "Coordinator: funded %s with %s."
				  , c->address.c_str(), txid.c_str()
				  );
		});
	}

	Ev::Io<void> propose( std::shared_ptr<Contract> c
			    , Action action
			    , Role role
			    , SignerIF& initiator
			    , std::vector<Vtxo> const& vtxos
			    ) {
		auto unspent = std::vector<Vtxo>();
		for (auto const& v : vtxos)
			if (!v.is_spent())
				unspent.push_back(v);
		if (unspent.empty())
			throw NoFunds(c->address);

		auto roles = Authorizer::required_signers(action, role);
		if (roles.empty())
			throw NotAuthorized(to_string(action), to_string(role));

		auto key = initiator.pubkey();
		auto required = KeyList();
		for (auto r : roles) {
			auto const& k = c->party(r).pubkey;
			if (k != key)
				required.push_back(k);
		}

		auto s = script(*c);
		auto const& vtxo = unspent[0];
		auto tx = OffchainTx::build(
			{ OffchainInput{vtxo, s.pk_script(), s.leaf(path_of(action))} },
			Detail::action_outputs(*c, action, vtxo.value),
			s.server_unroll_script()
		);
		auto ptx = std::make_shared<PartialTx>(PartialTx{
			vtxo,
			std::move(tx.ark_tx),
			std::move(tx.checkpoints),
			std::move(required),
			KeyList{key},
			KeyList()
		});

		return sign_partial(initiator, ptx).then([this, c, ptx, action, key]() {
			auto pending = std::make_shared<PendingTransaction>(
				PendingTransaction{ action
						  , key
						  , Ev::now_ms()
						  , PendingCosign
						  , *ptx
						  }
			);
			c->pending = pending;
			return registry.upsert(*c).then([this, c, pending]() {
				return transport.notify_pending_transaction(
					c->address, *pending
				);
			}).then([this, c, action, key]() {
				return log( bus, Info
					  , "Coordinator: %s proposed %s on %s."
					  , hex(key).c_str()
					  , to_string(action).c_str()
					  , c->address.c_str()
					  );
			});
		});
	}

	/* Checks common to approve and reject.  */
	void check_vote( Contract const& c
		       , Secp256k1::XonlyPubKey const& k
		       ) const {
		if (!c.pending)
			throw NoPendingTransaction(c.address);
		auto const& ptx = c.pending->partial_tx;
		if (!contains(ptx.required_signers, k))
			throw NotRequired(hex(k));
		if (contains(ptx.approvals, k))
			throw AlreadyApproved(hex(k));
		if (contains(ptx.rejections, k))
			throw AlreadyRejected(hex(k));
		if (c.pending->status == Rejected)
			throw NotPending(c.address);
	}

	/* Submission then finalization of an approved
	 * transaction; clears it on success.
	 */
	Ev::Io<std::string> submit(std::shared_ptr<Contract> c) {
		auto pending = c->pending;
		auto const& ptx = pending->partial_tx;
		return submitter.submit(ptx.spend_tx, ptx.checkpoint_txs)
			.then([this, pending](std::string ark_txid) {
			return submitter.finalize( ark_txid
						 , pending->partial_tx.checkpoint_txs
						 )
				.then([ark_txid]() {
				return Ev::lift(ark_txid);
			});
		}).then([this, c](std::string ark_txid) {
			auto action = c->pending->action;
			c->pending = nullptr;
			return registry.upsert(*c).then([this, c, action, ark_txid]() {
				return log( bus, Info
					  , "Coordinator: %s on %s executed as %s."
					  , to_string(action).c_str()
					  , c->address.c_str()
					  , ark_txid.c_str()
					  );
			}).then([ark_txid]() {
				return Ev::lift(ark_txid);
			});
		}).catching<NetworkError>([this, c](NetworkError const& e) {
			auto err = std::make_shared<NetworkError>(e);
			return log( bus, Warn
				  , "Coordinator: executing on %s failed, "
				    "pending transaction kept: %s"
				  , c->address.c_str(), e.what()
				  ).then([err]() {
				return Ev::fail<std::string>(*err);
			});
		});
	}

	Ev::Io<void> clear_rejected( std::string address
				   , std::shared_ptr<PendingTransaction const> rejected
				   ) {
		return registry.exclusive(address, Ev::lift().then([this, address, rejected]() {
			if (!registry.has(address))
				return Ev::lift();
			auto c = registry.find(address);
			if (!c.pending || *c.pending != *rejected)
				return Ev::lift();
			c.pending = nullptr;
			return registry.upsert(std::move(c)).then([this, address]() {
				return log( bus, Debug
					  , "Coordinator: cleared rejected "
					    "transaction on %s."
					  , address.c_str()
					  );
			});
		}));
	}
};

Coordinator::Coordinator( S::Bus& bus
			, ContractRegistry& registry
			, TransportIF& transport
			, ChainQueryIF& query
			, ChainSubmitIF& submitter
			, FundingIF& funding
			, Waiter& waiter
			, CoordinatorSettings settings
			) : pimpl(Util::make_unique<Impl>( bus
							 , registry
							 , transport
							 , query
							 , submitter
							 , funding
							 , waiter
							 , std::move(settings)
							 )) { }
Coordinator::~Coordinator() { }

Script Coordinator::script(Contract const& c) const {
	return pimpl->script(c);
}

Ev::Io<Contract> Coordinator::open_contract( Party buyer
					   , Party seller
					   , Party arbitrator
					   , std::string description
					   ) {
	auto c = std::make_shared<Contract>(Contract{
		"",
		std::move(buyer),
		std::move(seller),
		std::move(arbitrator),
		std::move(description),
		Ev::now_ms(),
		nullptr
	});
	return Ev::lift().then([this, c]() {
		c->address = pimpl->script(*c)
			.address(pimpl->settings.network)
			.encode()
			;
		if (pimpl->registry.has(c->address))
			return Ev::lift(pimpl->registry.find(c->address));
		return pimpl->registry.upsert(*c).then([this, c]() {
			return log( pimpl->bus, Info
				  , "Coordinator: opened %s for %s, %s and %s."
				  , c->address.c_str()
				  , c->buyer.name.c_str()
				  , c->seller.name.c_str()
				  , c->arbitrator.name.c_str()
				  );
		}).then([c]() {
			return Ev::lift(*c);
		});
	});
}

Ev::Io<void> Coordinator::create( std::string address
				, Action action
				, SignerIF& initiator
				) {
	auto& registry = pimpl->registry;
	return registry.exclusive(address, Ev::lift().then([ this
							   , address
							   , action
							   , &initiator
							   ]() {
		auto c = std::make_shared<Contract>(pimpl->registry.find(address));
		/* A rejection nobody here is waiting on is stale; it
		 * gives way to the new transaction.  */
		if (c->pending && ( c->pending->status != Rejected
				 || pimpl->clearing.count(address) != 0
				  ))
			throw PendingTransactionExists(address);
		c->pending = nullptr;
		auto key = initiator.pubkey();
		auto role = Role();
		if (!c->role_of(key, role))
			throw NotAuthorized(to_string(action), "non-party " + hex(key));

		auto pk_script = pimpl->script(*c).pk_script();
		return pimpl->query.get_unspent_outputs(pk_script)
			.then([ this, c, action, role
			      , &initiator
			      ](std::vector<Vtxo> vtxos) {
			if (action == Fund)
				return pimpl->fund(c, role, vtxos);
			return pimpl->propose(c, action, role, initiator, vtxos);
		});
	}));
}

Ev::Io<bool> Coordinator::approve(std::string address, SignerIF& signer) {
	auto& registry = pimpl->registry;
	return registry.exclusive(address, Ev::lift().then([ this
							   , address
							   , &signer
							   ]() {
		auto c = std::make_shared<Contract>(pimpl->registry.find(address));
		auto key = signer.pubkey();
		pimpl->check_vote(*c, key);

		auto ptx = std::make_shared<PartialTx>(c->pending->partial_tx);
		return sign_partial(signer, ptx).then([this, c, ptx, key]() {
			auto pending = std::make_shared<PendingTransaction>(
				*c->pending
			);
			pending->partial_tx = *ptx;
			pending->partial_tx.approvals.push_back(key);
			auto done = pending->fully_approved();
			if (done)
				pending->status = Approved;
			c->pending = pending;
			return pimpl->registry.upsert(*c).then([this, c, key]() {
				return log( pimpl->bus, Info
					  , "Coordinator: %s approved %s on %s."
					  , hex(key).c_str()
					  , to_string(c->pending->action).c_str()
					  , c->address.c_str()
					  );
			}).then([this, c, done]() {
				if (!done)
					return Ev::lift(false);
				return pimpl->submit(c).then([](std::string) {
					return Ev::lift(true);
				});
			});
		});
	}));
}

Ev::Io<std::string> Coordinator::execute(std::string address) {
	auto& registry = pimpl->registry;
	return registry.exclusive(address, Ev::lift().then([this, address]() {
		auto c = std::make_shared<Contract>(pimpl->registry.find(address));
		if (!c->pending)
			throw NoPendingTransaction(address);
		if (c->pending->status == Rejected)
			throw NotPending(address);
		if (!c->pending->fully_approved())
			throw AwaitingSignatures(address);
		return pimpl->submit(c);
	}));
}

Ev::Io<void> Coordinator::reject( std::string address
				, Secp256k1::XonlyPubKey signer
				) {
	auto& registry = pimpl->registry;
	auto psigner = std::make_shared<Secp256k1::XonlyPubKey>(std::move(signer));
	return registry.exclusive(address, Ev::lift().then([ this
							   , address
							   , psigner
							   ]() {
		auto c = std::make_shared<Contract>(pimpl->registry.find(address));
		auto const& key = *psigner;
		pimpl->check_vote(*c, key);

		auto pending = std::make_shared<PendingTransaction>(*c->pending);
		pending->partial_tx.rejections.push_back(key);
		pending->status = Rejected;
		c->pending = pending;
		auto grace = pimpl->settings.reject_grace;

		return pimpl->registry.upsert(*c).then([this, c, psigner]() {
			return log( pimpl->bus, Info
				  , "Coordinator: %s rejected %s on %s."
				  , hex(*psigner).c_str()
				  , to_string(c->pending->action).c_str()
				  , c->address.c_str()
				  );
		}).then([this, address, pending, grace]() {
			auto rejected = std::shared_ptr<PendingTransaction const>(
				pending
			);
			pimpl->clearing.insert(address);
			auto clear = pimpl->waiter.wait(grace)
				.then([this, address, rejected]() {
				return pimpl->clear_rejected(address, rejected);
			}).catching<Escrow::Shutdown>([](Escrow::Shutdown const&) {
				return Ev::lift();
			}).then([this, address]() {
				pimpl->clearing.erase(address);
				return Ev::lift();
			});
			return Ev::concurrent(clear);
		});
	}));
}

Ev::Io<EscrowState> Coordinator::escrow_state(std::string address) {
	return Ev::lift().then([this, address]() {
		auto c = pimpl->registry.find(address);
		return pimpl->query.get_unspent_outputs(pimpl->script(c).pk_script());
	}).then([](std::vector<Vtxo> vtxos) {
		return Ev::lift(EscrowState::from_vtxos(vtxos));
	});
}

}
