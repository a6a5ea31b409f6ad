#ifndef TESTS_ESCROW_HARNESS_HPP
#define TESTS_ESCROW_HARNESS_HPP

/* Fixtures shared by the escrow tests: fixed keys, an
 * in-memory Ark server, and a device wired to a relay.
 */

#include"Bitcoin/Psbt.hpp"
#include"Bitcoin/TxId.hpp"
#include"Escrow/ArkAddress.hpp"
#include"Escrow/ChainQueryIF.hpp"
#include"Escrow/ChainSubmitIF.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/ContractRegistry.hpp"
#include"Escrow/Coordinator.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/FundingIF.hpp"
#include"Escrow/KeySigner.hpp"
#include"Escrow/Relay.hpp"
#include"Escrow/RelayTransport.hpp"
#include"Escrow/Waiter.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sqlite3.hpp"
#include"Util/Str.hpp"
#include<map>
#include<string>
#include<vector>

namespace Harness {

typedef std::vector<std::uint8_t> Bytes;

/* The scalar n, for small n.  */
inline
Secp256k1::PrivKey privkey(unsigned n) {
	return Secp256k1::PrivKey(Util::Str::fmt("%064x", n));
}
inline
Secp256k1::XonlyPubKey pubkey(unsigned n) {
	return Secp256k1::XonlyPubKey(privkey(n));
}

unsigned const buyer_sk = 1;
unsigned const seller_sk = 2;
unsigned const arbitrator_sk = 3;
unsigned const server_sk = 4;

inline
Escrow::CoordinatorSettings settings(double reject_grace = 0.05) {
	return Escrow::CoordinatorSettings{
		pubkey(server_sk),
		Escrow::RelativeTimelock::from_delay(144),
		Escrow::Regtest,
		reject_grace
	};
}

/* Payouts go to a wallet key distinct from the signing key.  */
inline
Escrow::Party party(unsigned sk, std::string name, std::uint64_t created_at) {
	auto wallet = Escrow::ArkAddress( "tark"
					, pubkey(server_sk)
					, pubkey(sk + 100)
					);
	return Escrow::Party{ std::move(name)
			    , pubkey(sk)
			    , wallet.encode()
			    , created_at
			    };
}

inline
Bytes payout_script(unsigned sk) {
	return Escrow::ArkAddress("tark", pubkey(server_sk), pubkey(sk + 100))
		.pk_script();
}

/** class Harness::FakeArk
 *
 * @brief the Ark server and the buyer's wallet, in memory.
 *
 * @desc Funding creates an output of `fund_amount` at the
 * address.  Finalizing marks the output the checkpoints
 * spend as spent.
 */
class FakeArk : public Escrow::ChainQueryIF
	      , public Escrow::ChainSubmitIF
	      , public Escrow::FundingIF {
public:
	std::map<std::string, std::vector<Escrow::Vtxo>> outputs;
	std::uint64_t fund_amount;
	std::size_t queries;
	std::size_t submits;
	std::size_t finalizes;
	bool fail_submit;
	bool fail_finalize;
	std::vector<Bitcoin::Psbt> submitted;
	std::vector<std::string> funded;
	std::size_t num_txids;

	FakeArk() : fund_amount(100000)
		  , queries(0), submits(0), finalizes(0)
		  , fail_submit(false), fail_finalize(false)
		  , num_txids(0)
		  { }

	Bitcoin::TxId next_txid() {
		return Bitcoin::TxId(Util::Str::fmt("%064zx", ++num_txids));
	}

	/* Adds an output paying to the address.  */
	Escrow::Vtxo pay(std::string const& address, std::uint64_t amount) {
		auto pk = Escrow::ArkAddress::decode(address).pk_script();
		auto v = Escrow::Vtxo{next_txid(), 0, amount, ""};
		outputs[Util::Str::hexdump(pk)].push_back(v);
		return v;
	}

	Ev::Io<std::vector<Escrow::Vtxo>>
	get_unspent_outputs(Bytes pk_script) override {
		return Ev::lift().then([this, pk_script]() {
			++queries;
			auto it = outputs.find(Util::Str::hexdump(pk_script));
			if (it == outputs.end())
				return Ev::lift(std::vector<Escrow::Vtxo>());
			return Ev::lift(it->second);
		});
	}

	Ev::Io<std::string>
	submit( Bitcoin::Psbt ark_tx
	      , std::vector<Bitcoin::Psbt>
	      ) override {
		return Ev::lift().then([this, ark_tx]() {
			if (fail_submit)
				throw Escrow::NetworkError("submit refused");
			++submits;
			submitted.push_back(ark_tx);
			return Ev::lift(std::string(ark_tx.tx.get_txid()));
		});
	}

	Ev::Io<void>
	finalize( std::string reference
		, std::vector<Bitcoin::Psbt> checkpoints
		) override {
		return Ev::lift().then([this, reference, checkpoints]() {
			if (fail_finalize)
				throw Escrow::NetworkError("finalize refused");
			++finalizes;
			for (auto const& cp : checkpoints)
				for (auto const& in : cp.tx.inputs)
					mark_spent(in.prevTxid, in.prevOut, reference);
			return Ev::lift();
		});
	}

	Ev::Io<std::string> send_to_address(std::string address) override {
		return Ev::lift().then([this, address]() {
			auto v = pay(address, fund_amount);
			funded.push_back(address);
			return Ev::lift(std::string(v.txid));
		});
	}

private:
	void mark_spent( Bitcoin::TxId const& txid, std::uint32_t vout
		       , std::string const& by
		       ) {
		for (auto& o : outputs)
			for (auto& v : o.second)
				if (v.txid == txid && v.vout == vout)
					v.spent_by = by;
	}
};

/* One participant's process: its registry and coordinator,
 * talking to the shared relay and Ark server.
 */
struct Device {
	S::Bus bus;
	Escrow::RelayTransport transport;
	Escrow::ContractRegistry registry;
	Escrow::Waiter waiter;
	Escrow::Coordinator coordinator;

	Device( Escrow::Relay& relay
	      , FakeArk& ark
	      , Sqlite3::Db db = Sqlite3::Db()
	      , double reject_grace = 0.05
	      ) : bus()
		, transport(relay)
		, registry(bus, transport, std::move(db))
		, waiter(bus)
		, coordinator( bus, registry, transport
			     , ark, ark, ark
			     , waiter
			     , settings(reject_grace)
			     )
		{ }
};

/* Whether the action failed with an `e`.  */
template<typename e>
Ev::Io<bool> throws(Ev::Io<void> io) {
	return io.then([]() {
		return Ev::lift(false);
	}).template catching<e>([](e const&) {
		return Ev::lift(true);
	});
}
template<typename e, typename a>
Ev::Io<bool> throws(Ev::Io<a> io) {
	return io.then([](a) {
		return Ev::lift(false);
	}).template catching<e>([](e const&) {
		return Ev::lift(true);
	});
}

}

#endif /* !defined(TESTS_ESCROW_HARNESS_HPP) */
