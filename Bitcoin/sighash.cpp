#include"Bitcoin/Tx.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/sighash.hpp"
#include"Bitcoin/varint.hpp"
#include"Secp256k1/tagged_hashes.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/HasherStream.hpp"
#include<sstream>

namespace {

using ::Bitcoin::SighashFlags;
using ::Bitcoin::SIGHASH_DEFAULT;
using ::Bitcoin::SIGHASH_ALL;
using ::Bitcoin::SIGHASH_NONE;
using ::Bitcoin::SIGHASH_SINGLE;
using ::Bitcoin::SIGHASH_ANYONECANPAY;
using ::Bitcoin::InvalidSighash;
using ::Bitcoin::p2trSpendType;

void feed_hash(std::ostream& os, Sha256::Hash const& hash) {
	std::uint8_t buf[32];
	hash.to_buffer(buf);
	os.write((char const*) buf, sizeof(buf));
}

void
p2tr_sigmsg( std::ostream& msg
	   , Bitcoin::Tx const& tx
	   , SighashFlags flags
	   , std::uint32_t nIn
	   , std::vector<Bitcoin::TxOut> const& prevouts
	   , p2trSpendType spendtype
	   ) {
	auto loflags = flags & 0x03;
	auto acp = (flags & SIGHASH_ANYONECANPAY) != 0;

	if (flags != SIGHASH_DEFAULT
	 && (loflags == 0 || (flags & ~(0x03 | SIGHASH_ANYONECANPAY)) != 0))
		throw InvalidSighash("Invalid SIGHASH flag");
	if (nIn >= tx.inputs.size())
		throw InvalidSighash("nIn out of range");
	if (prevouts.size() != tx.inputs.size())
		throw InvalidSighash("prevouts do not match inputs");
	if (loflags == SIGHASH_SINGLE && nIn >= tx.outputs.size())
		throw InvalidSighash("SIGHASH_SINGLE without matching output");

	/* Epoch, then hash type.  */
	msg.put(0x00);
	msg.put(char(flags));
	msg << Bitcoin::le(tx.nVersion)
	    << Bitcoin::le(tx.nLockTime)
	     ;

	if (!acp) {
		Sha256::HasherStream prevouts_h;
		Sha256::HasherStream amounts_h;
		Sha256::HasherStream spks_h;
		Sha256::HasherStream sequences_h;
		for (auto i = std::size_t(0); i < tx.inputs.size(); ++i) {
			auto const& in = tx.inputs[i];
			prevouts_h << in.prevTxid << Bitcoin::le(in.prevOut);
			amounts_h << Bitcoin::le(prevouts[i].amount);
			spks_h << Bitcoin::varbytes(prevouts[i].scriptPubKey);
			sequences_h << Bitcoin::le(in.nSequence);
		}
		feed_hash(msg, std::move(prevouts_h).finalize());
		feed_hash(msg, std::move(amounts_h).finalize());
		feed_hash(msg, std::move(spks_h).finalize());
		feed_hash(msg, std::move(sequences_h).finalize());
	}
	if (loflags != SIGHASH_NONE && loflags != SIGHASH_SINGLE) {
		Sha256::HasherStream outputs_h;
		for (auto const& o : tx.outputs)
			outputs_h << o;
		feed_hash(msg, std::move(outputs_h).finalize());
	}

	msg.put(char(spendtype));

	if (acp) {
		auto const& in = tx.inputs[nIn];
		msg << in.prevTxid
		    << Bitcoin::le(in.prevOut)
		    << Bitcoin::le(prevouts[nIn].amount)
		     ;
		msg << Bitcoin::varbytes(prevouts[nIn].scriptPubKey);
		msg << Bitcoin::le(in.nSequence);
	} else {
		msg << Bitcoin::le(nIn);
	}

	if (loflags == SIGHASH_SINGLE) {
		Sha256::HasherStream single_h;
		single_h << tx.outputs[nIn];
		feed_hash(msg, std::move(single_h).finalize());
	}
}

}

namespace Bitcoin {

Sha256::Hash
p2tr_sighash( Bitcoin::Tx const& tx
	    , SighashFlags flags
	    , std::uint32_t nIn
	    , std::vector<Bitcoin::TxOut> const& prevouts
	    ) {
	Sha256::HasherStream hasher(
		Secp256k1::Tag::str(Secp256k1::Tag::SIGHASH)
	);
	p2tr_sigmsg(hasher, tx, flags, nIn, prevouts, KEYPATH);
	return std::move(hasher).finalize();
}

Sha256::Hash
p2tr_script_sighash( Bitcoin::Tx const& tx
		   , SighashFlags flags
		   , std::uint32_t nIn
		   , std::vector<Bitcoin::TxOut> const& prevouts
		   , Sha256::Hash const& tapleaf_hash
		   ) {
	Sha256::HasherStream hasher(
		Secp256k1::Tag::str(Secp256k1::Tag::SIGHASH)
	);
	p2tr_sigmsg(hasher, tx, flags, nIn, prevouts, SCRIPTPATH);
	feed_hash(hasher, tapleaf_hash);
	/* Key version, then codesep position (none).  */
	hasher.put(0x00);
	hasher << Bitcoin::le(std::uint32_t(0xFFFFFFFF));
	return std::move(hasher).finalize();
}

}
