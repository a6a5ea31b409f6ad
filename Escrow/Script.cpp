#include"Escrow/Detail/tapscript.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/Script.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>

namespace {

Secp256k1::XonlyPubKey
checked_key(std::vector<std::uint8_t> const& bytes, char const* role) {
	if (bytes.size() != 32)
		throw Escrow::InvalidKeyLength(role, bytes.size());
	return Secp256k1::XonlyPubKey::from_bytes(bytes);
}

/* Lengths first, then distinctness, then curve membership.  */
Escrow::EscrowOptions const& validate(Escrow::EscrowOptions const& o) {
	struct Entry {
		char const* role;
		std::vector<std::uint8_t> const* key;
	};
	Entry const entries[] =
	{ {"buyer", &o.buyer}
	, {"seller", &o.seller}
	, {"arbitrator", &o.arbitrator}
	, {"server", &o.server}
	};
	for (auto const& e : entries)
		if (e.key->size() != 32)
			throw Escrow::InvalidKeyLength(e.role, e.key->size());
	for (auto i = 0; i < 4; ++i)
		for (auto j = i + 1; j < 4; ++j)
			if (sodium_memcmp( &(*entries[i].key)[0]
					 , &(*entries[j].key)[0]
					 , 32
					 ) == 0)
				throw Escrow::DuplicateKey( entries[i].role
							  , entries[j].role
							  );
	return o;
}

std::vector<std::vector<std::uint8_t>>
build_scripts( Secp256k1::XonlyPubKey const& buyer
	     , Secp256k1::XonlyPubKey const& seller
	     , Secp256k1::XonlyPubKey const& arbitrator
	     , Secp256k1::XonlyPubKey const& server
	     , Escrow::RelativeTimelock const& delay
	     ) {
	using Escrow::Detail::multisig_script;
	using Escrow::Detail::csv_multisig_script;
	typedef std::vector<Secp256k1::XonlyPubKey> Keys;
	return std::vector<std::vector<std::uint8_t>>
	{ multisig_script(Keys{seller, arbitrator, server})
	, multisig_script(Keys{buyer, arbitrator, server})
	, multisig_script(Keys{buyer, seller, server})
	, csv_multisig_script(Keys{seller, arbitrator}, delay)
	, csv_multisig_script(Keys{buyer, arbitrator}, delay)
	, csv_multisig_script(Keys{buyer, seller}, delay)
	};
}

}

namespace Escrow {

Script::Script(EscrowOptions const& opts)
	: buyer(checked_key(validate(opts).buyer, "buyer"))
	, seller(checked_key(opts.seller, "seller"))
	, arbitrator(checked_key(opts.arbitrator, "arbitrator"))
	, server(checked_key(opts.server, "server"))
	, delay(opts.unilateral_delay)
	, taproot( Secp256k1::nums_key()
		 , Secp256k1::TapscriptTree(build_scripts( buyer, seller
							 , arbitrator, server
							 , delay
							 ))
		 )
	{ }

Secp256k1::XonlyPubKey const& Script::key(Role r) const {
	switch (r) {
	case Buyer: return buyer;
	case Seller: return seller;
	case Arbitrator: return arbitrator;
	case Server: return server;
	}
	return server;
}

std::vector<std::uint8_t> const& Script::script(Path p) const {
	return taproot.tree().script(std::size_t(p));
}

ArkAddress Script::address(Network n) const {
	return ArkAddress(ark_hrp(n), server, taproot.output_key());
}

TapLeaf Script::leaf(Path p) const {
	auto i = std::size_t(p);
	return TapLeaf{ taproot.tree().script(i)
		      , Secp256k1::tapleaf_version
		      , taproot.control_block(i)
		      };
}

TapLeaf Script::find_leaf(std::vector<std::uint8_t> const& s) const {
	auto i = taproot.tree().find(s);
	if (i == taproot.tree().size())
		throw LeafNotFound(Util::Str::hexdump(s));
	return leaf(Path(i));
}

std::vector<Role> Script::signers(Path p) {
	switch (p) {
	case Release: return {Seller, Arbitrator, Server};
	case Refund: return {Buyer, Arbitrator, Server};
	case Direct: return {Buyer, Seller, Server};
	case UnilateralRelease: return {Seller, Arbitrator};
	case UnilateralRefund: return {Buyer, Arbitrator};
	case UnilateralDirect: return {Buyer, Seller};
	}
	return {};
}

std::string Script::name(Path p) {
	switch (p) {
	case Release: return "release";
	case Refund: return "refund";
	case Direct: return "direct";
	case UnilateralRelease: return "unilateralRelease";
	case UnilateralRefund: return "unilateralRefund";
	case UnilateralDirect: return "unilateralDirect";
	}
	return "";
}

std::vector<Script::PathInfo> Script::spending_paths() const {
	static char const* const descriptions[num_paths] =
	{ "Release funds to seller (goods delivered)"
	, "Refund funds to buyer (dispute resolved)"
	, "Direct settlement between parties"
	, "Release funds after timelock"
	, "Refund funds after timelock"
	, "Direct settlement after timelock"
	};
	auto rv = std::vector<PathInfo>();
	for (auto i = std::size_t(0); i < num_paths; ++i) {
		auto p = Path(i);
		rv.push_back(PathInfo{ p
				     , name(p)
				     , i < 3
				     , descriptions[i]
				     , Util::Str::hexdump(script(p))
				     , signers(p)
				     });
	}
	return rv;
}

std::vector<std::uint8_t> Script::server_unroll_script() const {
	return Detail::csv_multisig_script( std::vector<Secp256k1::XonlyPubKey>{server}
					  , delay
					  );
}

}
