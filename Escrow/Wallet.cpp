#include"Escrow/ChainQueryIF.hpp"
#include"Escrow/ChainSubmitIF.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/Detail/tapscript.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/OffchainTx.hpp"
#include"Escrow/SignerIF.hpp"
#include"Escrow/Wallet.hpp"
#include"Escrow/log.hpp"
#include"Ev/Io.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Util/make_unique.hpp"

namespace {

typedef std::vector<Secp256k1::XonlyPubKey> Keys;

Secp256k1::TaprootCommitment
commitment( Secp256k1::XonlyPubKey const& owner
	  , Secp256k1::XonlyPubKey const& server
	  , Escrow::RelativeTimelock const& delay
	  ) {
	using Escrow::Detail::multisig_script;
	using Escrow::Detail::csv_multisig_script;
	auto scripts = std::vector<std::vector<std::uint8_t>>
	{ multisig_script(Keys{owner, server})
	, csv_multisig_script(Keys{owner}, delay)
	};
	return Secp256k1::TaprootCommitment( Secp256k1::nums_key()
					   , Secp256k1::TapscriptTree(std::move(scripts))
					   );
}

/* Signs the ark transaction, then each checkpoint in turn.  */
Ev::Io<void> sign_all( Escrow::SignerIF& signer
		     , std::shared_ptr<Escrow::OffchainTx> tx
		     , std::size_t i
		     ) {
	if (i > tx->checkpoints.size())
		return Ev::lift();
	auto& psbt = (i == 0) ? tx->ark_tx : tx->checkpoints[i - 1];
	return signer.sign(psbt).then([&signer, tx, i](Bitcoin::Psbt s) {
		if (i == 0)
			tx->ark_tx = std::move(s);
		else
			tx->checkpoints[i - 1] = std::move(s);
		return sign_all(signer, tx, i + 1);
	});
}

}

namespace Escrow {

class Wallet::Impl {
public:
	S::Bus& bus;
	SignerIF& owner;
	ChainQueryIF& query;
	ChainSubmitIF& submitter;
	Secp256k1::XonlyPubKey server;
	RelativeTimelock delay;
	Network network;
	Secp256k1::TaprootCommitment taproot;

	Impl( S::Bus& bus_
	    , SignerIF& owner_
	    , ChainQueryIF& query_
	    , ChainSubmitIF& submitter_
	    , Secp256k1::XonlyPubKey server_
	    , RelativeTimelock delay_
	    , Network network_
	    ) : bus(bus_)
	      , owner(owner_)
	      , query(query_)
	      , submitter(submitter_)
	      , server(std::move(server_))
	      , delay(delay_)
	      , network(network_)
	      , taproot(commitment(owner.pubkey(), server, delay))
	      { }

	Ev::Io<std::vector<Vtxo>> unspent() {
		return query.get_unspent_outputs(taproot.pk_script())
			.then([](std::vector<Vtxo> vtxos) {
			auto rv = std::vector<Vtxo>();
			for (auto& v : vtxos)
				if (!v.is_spent())
					rv.push_back(std::move(v));
			return Ev::lift(std::move(rv));
		});
	}

	TapLeaf collaborative_leaf() const {
		return TapLeaf{ taproot.tree().script(0)
			      , Secp256k1::tapleaf_version
			      , taproot.control_block(0)
			      };
	}
	std::vector<std::uint8_t> server_unroll() const {
		return Detail::csv_multisig_script(Keys{server}, delay);
	}
};

Wallet::Wallet( S::Bus& bus
	      , SignerIF& owner
	      , ChainQueryIF& query
	      , ChainSubmitIF& submitter
	      , Secp256k1::XonlyPubKey server
	      , RelativeTimelock delay
	      , Network network
	      ) : pimpl(Util::make_unique<Impl>( bus, owner
					      , query, submitter
					      , std::move(server)
					      , delay
					      , network
					      ))
		{ }
Wallet::~Wallet() { }

ArkAddress Wallet::address_of( Secp256k1::XonlyPubKey const& owner
			     , Secp256k1::XonlyPubKey const& server
			     , RelativeTimelock const& delay
			     , Network network
			     ) {
	return ArkAddress( ark_hrp(network)
			 , server
			 , commitment(owner, server, delay).output_key()
			 );
}

ArkAddress Wallet::address() const {
	return ArkAddress( ark_hrp(pimpl->network)
			 , pimpl->server
			 , pimpl->taproot.output_key()
			 );
}

Ev::Io<std::uint64_t> Wallet::balance() {
	return pimpl->unspent().then([](std::vector<Vtxo> vtxos) {
		auto total = std::uint64_t(0);
		for (auto const& v : vtxos)
			total += v.value;
		return Ev::lift(total);
	});
}

Ev::Io<std::string> Wallet::send_to_address(std::string address) {
	return Ev::lift().then([this, address]() {
		/* Validate before touching the network.  */
		auto dest = std::make_shared<std::vector<std::uint8_t>>(
			ArkAddress::decode(address).pk_script()
		);
		return pimpl->unspent().then([this, address, dest
					     ](std::vector<Vtxo> vtxos) {
			if (vtxos.empty())
				throw NoFunds(this->address().encode());
			auto pk_script = pimpl->taproot.pk_script();
			auto leaf = pimpl->collaborative_leaf();
			auto inputs = std::vector<OffchainInput>();
			auto total = std::uint64_t(0);
			for (auto const& v : vtxos) {
				inputs.push_back(OffchainInput{v, pk_script, leaf});
				total += v.value;
			}
			auto outputs = std::vector<Bitcoin::TxOut>();
			outputs.emplace_back(total, *dest);

			auto tx = std::make_shared<OffchainTx>(OffchainTx::build(
				inputs, outputs, pimpl->server_unroll()
			));
			return sign_all(pimpl->owner, tx, 0).then([this, tx]() {
				return pimpl->submitter.submit( tx->ark_tx
							      , tx->checkpoints
							      );
			}).then([this, tx](std::string ark_txid) {
				return pimpl->submitter.finalize( ark_txid
								, tx->checkpoints
								).then([ark_txid]() {
					return Ev::lift(ark_txid);
				});
			}).then([this, address, total](std::string ark_txid) {
				return log( pimpl->bus, Info
					  , "Wallet: sent %llu sats to %s in %s."
					  , (unsigned long long) total
					  , address.c_str()
					  , ark_txid.c_str()
					  ).then([ark_txid]() {
					return Ev::lift(ark_txid);
				});
			});
		});
	});
}

}
