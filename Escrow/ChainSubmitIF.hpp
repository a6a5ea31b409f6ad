#ifndef ESCROW_CHAINSUBMITIF_HPP
#define ESCROW_CHAINSUBMITIF_HPP

#include<string>
#include<vector>

namespace Bitcoin { struct Psbt; }
namespace Ev { template<typename a> class Io; }

namespace Escrow {

/** class Escrow::ChainSubmitIF
 *
 * @brief hands a fully signed spend to the Ark server.
 *
 * @desc `submit` gives back the reference id the server
 * assigned; `finalize` then completes the checkpoints under
 * that id.
 * Both throw Escrow::NetworkError on failure.
 */
class ChainSubmitIF {
public:
	virtual ~ChainSubmitIF() { }

	virtual
	Ev::Io<std::string>
	submit( Bitcoin::Psbt spend
	      , std::vector<Bitcoin::Psbt> checkpoints
	      ) =0;

	virtual
	Ev::Io<void>
	finalize( std::string reference
		, std::vector<Bitcoin::Psbt> checkpoints
		) =0;
};

}

#endif /* !defined(ESCROW_CHAINSUBMITIF_HPP) */
