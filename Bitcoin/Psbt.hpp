#ifndef BITCOIN_PSBT_HPP
#define BITCOIN_PSBT_HPP

#include"Bitcoin/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<iostream>
#include<map>
#include<stdexcept>
#include<string>
#include<vector>

namespace Bitcoin {

struct PsbtError : public Util::BacktraceException<std::invalid_argument> {
	PsbtError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Psbt: " + msg
		  ) { }
};

typedef std::map< std::vector<std::uint8_t>
		, std::vector<std::uint8_t>
		> PsbtMap;

/* PSBT_IN_TAP_LEAF_SCRIPT: a leaf that can spend the input.  */
struct PsbtTapLeafScript {
	std::vector<std::uint8_t> control_block;
	std::vector<std::uint8_t> script;
	std::uint8_t leaf_version;

	bool operator==(PsbtTapLeafScript const& o) const {
		return control_block == o.control_block
		    && script == o.script
		    && leaf_version == o.leaf_version
		     ;
	}
};

struct PsbtInput {
	bool has_witness_utxo;
	Bitcoin::TxOut witness_utxo;
	/* PSBT_IN_TAP_SCRIPT_SIG, keyed by
	 * 32-byte x-only pubkey || 32-byte tapleaf hash.
	 */
	PsbtMap tap_script_sigs;
	std::vector<PsbtTapLeafScript> tap_leaf_scripts;
	/* Other records, keyed by their full key bytes.  */
	PsbtMap unknown;

	PsbtInput() : has_witness_utxo(false) { }

	bool operator==(PsbtInput const& o) const {
		return has_witness_utxo == o.has_witness_utxo
		    && witness_utxo == o.witness_utxo
		    && tap_script_sigs == o.tap_script_sigs
		    && tap_leaf_scripts == o.tap_leaf_scripts
		    && unknown == o.unknown
		     ;
	}
};

struct PsbtOutput {
	PsbtMap unknown;

	bool operator==(PsbtOutput const& o) const {
		return unknown == o.unknown;
	}
};

/** struct Bitcoin::Psbt
 *
 * @brief a BIP174 partially signed transaction, with the
 * BIP371 taproot script-path input fields.
 *
 * @desc Records this code does not interpret are kept and
 * written back out unchanged.
 * The unsigned transaction must have empty scriptSigs and
 * witnesses.
 */
struct Psbt {
	Bitcoin::Tx tx;
	PsbtMap global_unknown;
	std::vector<PsbtInput> inputs;
	std::vector<PsbtOutput> outputs;

	Psbt() { }
	/* One empty input and output map per transaction
	 * input and output.
	 */
	explicit
	Psbt(Bitcoin::Tx tx);

	std::vector<std::uint8_t> to_bytes() const;
	/* Throws PsbtError if malformed.  */
	static Psbt from_bytes(std::vector<std::uint8_t> const&);

	/** Bitcoin::Psbt::merge_signatures
	 *
	 * @brief copies into this PSBT every taproot script
	 * signature in `o` that this one does not have yet.
	 *
	 * @desc Throws PsbtError if `o` is for a different
	 * unsigned transaction.
	 */
	void merge_signatures(Psbt const& o);

	/* Number of script signatures across all inputs.  */
	std::size_t num_signatures() const;

	bool operator==(Psbt const& o) const {
		return tx == o.tx
		    && global_unknown == o.global_unknown
		    && inputs == o.inputs
		    && outputs == o.outputs
		     ;
	}
	bool operator!=(Psbt const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Bitcoin::Psbt const&);

#endif /* !defined(BITCOIN_PSBT_HPP) */
