#ifndef ESCROW_CONTRACTCODEC_HPP
#define ESCROW_CONTRACTCODEC_HPP

#include"Escrow/Contract.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Escrow {

/* Thrown when a stored or received record cannot be read.  */
class DecodeError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	DecodeError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"DecodeError: " + msg
		  ) { }
};

/** Escrow::ContractCodec
 *
 * @brief the JSON form of contracts and parties, used both
 * in the database and on the wire.
 *
 * @desc Byte strings (keys, PSBTs) are written as hex.
 * Readers also accept them as arrays of integers 0..255.
 * Every decoding failure is reported as Escrow::DecodeError.
 */
namespace ContractCodec {

Json::Out encode(Party const&);
Json::Out encode(Contract const&);
Json::Out encode(PendingTransaction const&);
Json::Out encode(std::vector<Contract> const&);
Json::Out encode(std::vector<Party> const&);

Party decode_party(Jsmn::Object const&);
Contract decode_contract(Jsmn::Object const&);
PendingTransaction decode_pending_transaction(Jsmn::Object const&);
std::vector<Contract> decode_contracts(Jsmn::Object const&);
std::vector<Party> decode_parties(Jsmn::Object const&);

std::string to_json(Contract const&);
Contract contract_from_json(std::string const&);

}

}

#endif /* !defined(ESCROW_CONTRACTCODEC_HPP) */
