#include"Bitcoin/Psbt.hpp"
#include"Bitcoin/sighash.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/KeySigner.hpp"
#include"Ev/Io.hpp"
#include"Secp256k1/SchnorrSig.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>

namespace {

bool mentions( std::vector<std::uint8_t> const& script
	     , std::vector<std::uint8_t> const& push
	     ) {
	return std::search( script.begin(), script.end()
			  , push.begin(), push.end()
			  ) != script.end();
}

}

namespace Escrow {

class KeySigner::Impl {
public:
	Secp256k1::PrivKey sk;
	Secp256k1::XonlyPubKey pk;
	/* OP_PUSHBYTES_32 <pk>, as it appears in our scripts.  */
	std::vector<std::uint8_t> push;

	explicit
	Impl(Secp256k1::PrivKey sk_) : sk(std::move(sk_)), pk(sk) {
		push.push_back(0x20);
		auto b = pk.to_bytes();
		push.insert(push.end(), b.begin(), b.end());
	}
};

KeySigner::KeySigner(Secp256k1::PrivKey sk)
	: pimpl(Util::make_unique<Impl>(std::move(sk))) { }
KeySigner::~KeySigner() { }

Secp256k1::XonlyPubKey KeySigner::pubkey() const {
	return pimpl->pk;
}

Bitcoin::Psbt
KeySigner::sign_now( Bitcoin::Psbt psbt
		   , std::vector<std::size_t> const& inputs
		   ) const {
	auto prevouts = std::vector<Bitcoin::TxOut>();
	for (auto const& in : psbt.inputs) {
		if (!in.has_witness_utxo)
			throw SigningError("input without witness_utxo");
		prevouts.push_back(in.witness_utxo);
	}

	auto keybytes = pimpl->pk.to_bytes();
	auto signed_any = false;
	for (auto i : inputs) {
		if (i >= psbt.inputs.size())
			throw SigningError( "no input " + std::to_string(i)
					  + " to sign"
					  );
		auto& in = psbt.inputs[i];
		for (auto const& leaf : in.tap_leaf_scripts) {
			if (!mentions(leaf.script, pimpl->push))
				continue;
			auto leafhash = Secp256k1::tapleaf_hash( leaf.script
							       , leaf.leaf_version
							       );
			auto m = Bitcoin::p2tr_script_sighash( psbt.tx
							     , Bitcoin::SIGHASH_DEFAULT
							     , std::uint32_t(i)
							     , prevouts
							     , leafhash
							     );
			auto sig = Secp256k1::SchnorrSig::create(pimpl->sk, m);

			auto key = keybytes;
			std::uint8_t lh[32];
			leafhash.to_buffer(lh);
			key.insert(key.end(), lh, lh + 32);
			/* An existing signature under this key stays.  */
			in.tap_script_sigs.insert(std::make_pair( std::move(key)
								, sig.to_bytes()
								));
			signed_any = true;
		}
	}
	if (!signed_any)
		throw SigningError( "no leaf mentions key "
				  + std::string(pimpl->pk)
				  );
	return psbt;
}

Ev::Io<Bitcoin::Psbt> KeySigner::sign(Bitcoin::Psbt psbt) {
	auto inputs = std::vector<std::size_t>();
	for (auto i = std::size_t(0); i < psbt.inputs.size(); ++i)
		inputs.push_back(i);
	return sign(std::move(psbt), std::move(inputs));
}

Ev::Io<Bitcoin::Psbt>
KeySigner::sign(Bitcoin::Psbt psbt, std::vector<std::size_t> inputs) {
	auto ppsbt = std::make_shared<Bitcoin::Psbt>(std::move(psbt));
	return Ev::lift().then([this, ppsbt, inputs]() {
		return Ev::lift(sign_now(*ppsbt, inputs));
	});
}

}
