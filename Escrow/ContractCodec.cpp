#include"Escrow/ContractCodec.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/Str.hpp"
#include<cctype>

namespace {

using Escrow::DecodeError;

/* Funnels the format errors of the layers below into
 * DecodeError.
 */
template<typename F>
auto guarded(F f) -> decltype(f()) {
	try {
		return f();
	} catch (DecodeError const&) {
		throw;
	} catch (std::invalid_argument const& e) {
		throw DecodeError(e.what());
	} catch (std::runtime_error const& e) {
		throw DecodeError(e.what());
	}
}

Jsmn::Object member(Jsmn::Object const& o, char const* key) {
	if (!o.is_object())
		throw DecodeError(std::string("expected object holding ") + key);
	if (!o.has(key))
		throw DecodeError(std::string("missing field ") + key);
	return o[key];
}

std::string str(Jsmn::Object const& o, char const* key) {
	auto v = member(o, key);
	if (!v.is_string())
		throw DecodeError(std::string(key) + " is not a string");
	return (std::string) v;
}

std::uint64_t u64(Jsmn::Object const& v, char const* what) {
	if (!v.is_number())
		throw DecodeError(std::string(what) + " is not a number");
	auto text = v.direct_text();
	if (text.empty() || text.size() > 20)
		throw DecodeError(std::string(what) + " out of range");
	for (auto c : text)
		if (!std::isdigit((unsigned char) c))
			throw DecodeError( std::string(what)
					 + " is not a non-negative integer"
					 );
	return std::stoull(text);
}
std::uint64_t u64_field(Jsmn::Object const& o, char const* key) {
	return u64(member(o, key), key);
}

std::vector<std::uint8_t> bytes(Jsmn::Object const& v, char const* what) {
	if (v.is_string()) {
		auto s = (std::string) v;
		if (!Util::Str::ishex(s))
			throw DecodeError(std::string(what) + " is not hex");
		return Util::Str::hexread(s);
	}
	if (v.is_array()) {
		auto rv = std::vector<std::uint8_t>();
		rv.reserve(v.size());
		for (auto e : v) {
			auto b = u64(e, what);
			if (b > 255)
				throw DecodeError(std::string(what) + " has a byte over 255");
			rv.push_back(std::uint8_t(b));
		}
		return rv;
	}
	throw DecodeError(std::string(what) + " is neither hex nor byte array");
}

Secp256k1::XonlyPubKey key(Jsmn::Object const& v, char const* what) {
	auto b = bytes(v, what);
	if (b.size() != 32)
		throw DecodeError(std::string(what) + " is not a 32-byte key");
	return Secp256k1::XonlyPubKey::from_bytes(b);
}

Escrow::KeyList keys(Jsmn::Object const& o, char const* key_) {
	auto v = member(o, key_);
	if (!v.is_array())
		throw DecodeError(std::string(key_) + " is not an array");
	auto rv = Escrow::KeyList();
	for (auto e : v)
		rv.push_back(key(e, key_));
	return rv;
}

Bitcoin::Psbt psbt(Jsmn::Object const& v, char const* what) {
	return Bitcoin::Psbt::from_bytes(bytes(v, what));
}

std::string hex(Secp256k1::XonlyPubKey const& k) {
	return std::string(k);
}
std::string hex(Bitcoin::Psbt const& p) {
	return Util::Str::hexdump(p.to_bytes());
}

Json::Out encode_keys(Escrow::KeyList const& l) {
	auto rv = Json::Out();
	auto arr = rv.start_array();
	for (auto const& k : l)
		arr.entry(hex(k));
	arr.end_array();
	return rv;
}

Json::Out encode_pending(Escrow::PendingTransaction const& p) {
	auto const& ptx = p.partial_tx;

	auto checkpoints = Json::Out();
	auto arr = checkpoints.start_array();
	for (auto const& c : ptx.checkpoint_txs)
		arr.entry(hex(c));
	arr.end_array();

	return Json::Out()
		.start_object()
			.field("action", Escrow::to_string(p.action))
			.field("initiator", hex(p.initiator))
			.field("createdAt", p.created_at)
			.field("status", Escrow::to_string(p.status))
			.start_object("partialTx")
				.start_object("vtxo")
					.field("txid", std::string(ptx.vtxo.txid))
					.field("vout", ptx.vtxo.vout)
					.field("value", ptx.vtxo.value)
				.end_object()
				.field("spendTx", hex(ptx.spend_tx))
				.field("checkpointTxs", checkpoints)
				.field("requiredSigners", encode_keys(ptx.required_signers))
				.field("approvals", encode_keys(ptx.approvals))
				.field("rejections", encode_keys(ptx.rejections))
			.end_object()
		.end_object()
		;
}

Escrow::PendingTransaction decode_pending(Jsmn::Object const& o) {
	auto action = Escrow::Action();
	auto action_s = str(o, "action");
	if (!Escrow::parse_action(action_s, action))
		throw DecodeError("unknown action " + action_s);
	auto status = Escrow::PendingStatus();
	auto status_s = str(o, "status");
	if (!Escrow::parse_pending_status(status_s, status))
		throw DecodeError("unknown status " + status_s);

	auto p = member(o, "partialTx");
	auto v = member(p, "vtxo");
	auto vout = u64_field(v, "vout");
	if (vout > 0xFFFFFFFFULL)
		throw DecodeError("vout out of range");

	auto checkpoints = std::vector<Bitcoin::Psbt>();
	auto carr = member(p, "checkpointTxs");
	if (!carr.is_array())
		throw DecodeError("checkpointTxs is not an array");
	for (auto c : carr)
		checkpoints.push_back(psbt(c, "checkpointTxs"));

	return Escrow::PendingTransaction{
		action,
		key(member(o, "initiator"), "initiator"),
		u64_field(o, "createdAt"),
		status,
		Escrow::PartialTx{
			Escrow::Vtxo{ Bitcoin::TxId(str(v, "txid"))
				    , std::uint32_t(vout)
				    , u64_field(v, "value")
				    , ""
				    },
			psbt(member(p, "spendTx"), "spendTx"),
			std::move(checkpoints),
			keys(p, "requiredSigners"),
			keys(p, "approvals"),
			keys(p, "rejections")
		}
	};
}

}

namespace Escrow { namespace ContractCodec {

Json::Out encode(Party const& p) {
	return Json::Out()
		.start_object()
			.field("name", p.name)
			.field("pubkey", hex(p.pubkey))
			.field("address", p.address)
			.field("createdAt", p.created_at)
		.end_object()
		;
}

Json::Out encode(Contract const& c) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("address", c.address)
		.field("buyer", encode(c.buyer))
		.field("seller", encode(c.seller))
		.field("arbitrator", encode(c.arbitrator))
		.field("description", c.description)
		.field("createdAt", c.created_at)
		;
	if (c.pending)
		obj.field("pendingTransaction", encode_pending(*c.pending));
	obj.end_object();
	return rv;
}

Json::Out encode(PendingTransaction const& p) {
	return encode_pending(p);
}

Json::Out encode(std::vector<Contract> const& cs) {
	auto rv = Json::Out();
	auto arr = rv.start_array();
	for (auto const& c : cs)
		arr.entry(encode(c));
	arr.end_array();
	return rv;
}
Json::Out encode(std::vector<Party> const& ps) {
	auto rv = Json::Out();
	auto arr = rv.start_array();
	for (auto const& p : ps)
		arr.entry(encode(p));
	arr.end_array();
	return rv;
}

Party decode_party(Jsmn::Object const& o) {
	return guarded([&o]() {
		return Party{ str(o, "name")
			    , key(member(o, "pubkey"), "pubkey")
			    , str(o, "address")
			    , u64_field(o, "createdAt")
			    };
	});
}

Contract decode_contract(Jsmn::Object const& o) {
	return guarded([&o]() {
		auto pending = std::shared_ptr<PendingTransaction const>();
		if (o.is_object() && o.has("pendingTransaction")) {
			auto p = o["pendingTransaction"];
			if (!p.is_null())
				pending = std::make_shared<PendingTransaction>(
					decode_pending(p)
				);
		}
		return Contract{ str(o, "address")
			       , decode_party(member(o, "buyer"))
			       , decode_party(member(o, "seller"))
			       , decode_party(member(o, "arbitrator"))
			       , str(o, "description")
			       , u64_field(o, "createdAt")
			       , std::move(pending)
			       };
	});
}

PendingTransaction decode_pending_transaction(Jsmn::Object const& o) {
	return guarded([&o]() { return decode_pending(o); });
}

std::vector<Contract> decode_contracts(Jsmn::Object const& o) {
	if (!o.is_array())
		throw DecodeError("expected an array of contracts");
	auto rv = std::vector<Contract>();
	for (auto e : o)
		rv.push_back(decode_contract(e));
	return rv;
}
std::vector<Party> decode_parties(Jsmn::Object const& o) {
	if (!o.is_array())
		throw DecodeError("expected an array of participants");
	auto rv = std::vector<Party>();
	for (auto e : o)
		rv.push_back(decode_party(e));
	return rv;
}

std::string to_json(Contract const& c) {
	return encode(c).output();
}
Contract contract_from_json(std::string const& s) {
	return guarded([&s]() {
		return decode_contract(Jsmn::Object::parse_json(s));
	});
}

}}
