#ifndef ESCROW_KEYSIGNER_HPP
#define ESCROW_KEYSIGNER_HPP

#include"Escrow/SignerIF.hpp"
#include"Secp256k1/PrivKey.hpp"
#include<memory>

namespace Escrow {

/** class Escrow::KeySigner
 *
 * @brief signs tapscript spends with a private key held
 * in memory.
 *
 * @desc For each input, every leaf whose script mentions
 * our x-only key gets a BIP341 script-path signature with
 * `SIGHASH_DEFAULT`, recorded under (our key, leaf hash).
 * Every input of the PSBT must carry its `witness_utxo`.
 */
class KeySigner : public SignerIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	KeySigner(Secp256k1::PrivKey sk);
	~KeySigner();

	Secp256k1::XonlyPubKey pubkey() const override;

	Ev::Io<Bitcoin::Psbt> sign(Bitcoin::Psbt psbt) override;
	Ev::Io<Bitcoin::Psbt>
	sign(Bitcoin::Psbt psbt, std::vector<std::size_t> inputs) override;

	/* The synchronous core of both `sign`s.  */
	Bitcoin::Psbt
	sign_now( Bitcoin::Psbt psbt
		, std::vector<std::size_t> const& inputs
		) const;
};

}

#endif /* !defined(ESCROW_KEYSIGNER_HPP) */
