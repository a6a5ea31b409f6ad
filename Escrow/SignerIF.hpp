#ifndef ESCROW_SIGNERIF_HPP
#define ESCROW_SIGNERIF_HPP

#include<cstddef>
#include<vector>

namespace Bitcoin { struct Psbt; }
namespace Ev { template<typename a> class Io; }
namespace Secp256k1 { class XonlyPubKey; }

namespace Escrow {

/** class Escrow::SignerIF
 *
 * @brief abstract class representing an object that
 * adds its signatures to PSBTs.
 *
 * @desc The private key need not be in this process;
 * hence the asynchronous interface.
 * Signers add signatures and never remove them.
 * They throw Escrow::SigningError if they could not sign
 * anything.
 */
class SignerIF {
public:
	virtual ~SignerIF() { }

	virtual
	Secp256k1::XonlyPubKey pubkey() const =0;

	/* Signs every input it can.  */
	virtual
	Ev::Io<Bitcoin::Psbt> sign(Bitcoin::Psbt psbt) =0;
	/* Signs only the listed inputs.  */
	virtual
	Ev::Io<Bitcoin::Psbt>
	sign(Bitcoin::Psbt psbt, std::vector<std::size_t> inputs) =0;
};

}

#endif /* !defined(ESCROW_SIGNERIF_HPP) */
