#ifndef ESCROW_CHAINQUERYIF_HPP
#define ESCROW_CHAINQUERYIF_HPP

#include<cstdint>
#include<vector>

namespace Escrow { struct Vtxo; }
namespace Ev { template<typename a> class Io; }

namespace Escrow {

/** class Escrow::ChainQueryIF
 *
 * @brief looks up the virtual outputs paying to a script.
 *
 * @desc Spent outputs are included, with `spent_by` set.
 * Throws Escrow::NetworkError on failure.
 */
class ChainQueryIF {
public:
	virtual ~ChainQueryIF() { }

	virtual
	Ev::Io<std::vector<Vtxo>>
	get_unspent_outputs(std::vector<std::uint8_t> pk_script) =0;
};

}

#endif /* !defined(ESCROW_CHAINQUERYIF_HPP) */
