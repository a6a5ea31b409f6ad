#undef NDEBUG
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/SchnorrSig.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<sodium/core.h>

namespace {

typedef std::vector<std::uint8_t> Bytes;

/* Folds a leaf hash up its merkle path.  */
Sha256::Hash climb( Sha256::Hash leaf
		  , std::vector<Sha256::Hash> const& path
		  ) {
	for (auto const& sibling : path)
		leaf = Secp256k1::tapbranch_hash(leaf, sibling);
	return leaf;
}

}

int main() {
	assert(sodium_init() >= 0);

	/* Single-leaf vector from the BIP341 wallet test set.  */
	{
		auto script = Util::Str::hexread("20d85a959b0290bf19bb89ed43c916be835475d013da4b362117393e25a48229b8ac");
		auto tree = Secp256k1::TapscriptTree(std::vector<Bytes>{script});
		assert(tree.leaf_hash(0) == Sha256::Hash("5b75adecf53548f3ec6ad7d78383bf84cc57b55a3127c72b9a2481752dd88b21"));
		assert(tree.root() == tree.leaf_hash(0));
		assert(tree.merkle_path(0).empty());

		auto internal = Secp256k1::XonlyPubKey("187791b6f712a8ea41c8ecdd0ee77fab3e85263b37e1ec18a3651926b3a6cf27");
		auto commit = Secp256k1::TaprootCommitment(internal, tree);
		assert(std::string(commit.output_key()) == "147c9c57132f6e7ecddba9800bb0c4449251c92a1e60371ee77557b6620f3ea3");
		assert(Util::Str::hexdump(commit.pk_script()) == "5120147c9c57132f6e7ecddba9800bb0c4449251c92a1e60371ee77557b6620f3ea3");
		assert(Util::Str::hexdump(commit.control_block(0)) == "c1187791b6f712a8ea41c8ecdd0ee77fab3e85263b37e1ec18a3651926b3a6cf27");
	}

	/* Every leaf of an unbalanced tree climbs to the root.  */
	{
		auto scripts = std::vector<Bytes>();
		for (auto i = 0; i < 6; ++i)
			scripts.push_back(Bytes{std::uint8_t(0x51 + i)});
		auto tree = Secp256k1::TapscriptTree(scripts);
		assert(tree.size() == 6);
		for (auto i = std::size_t(0); i < tree.size(); ++i) {
			assert(tree.script(i) == scripts[i]);
			assert(tree.find(scripts[i]) == i);
			assert(tree.leaf_hash(i) == Secp256k1::tapleaf_hash(scripts[i]));
			auto const& path = tree.merkle_path(i);
			assert(path.size() == 2 || path.size() == 3);
			assert(climb(tree.leaf_hash(i), path) == tree.root());
		}
		assert(tree.find(Bytes{0x00}) == tree.size());

		auto commit = Secp256k1::TaprootCommitment( Secp256k1::nums_key()
							  , tree
							  );
		for (auto i = std::size_t(0); i < tree.size(); ++i) {
			auto cb = commit.control_block(i);
			assert(cb.size() == 33 + 32 * tree.merkle_path(i).size());
			assert((cb[0] & 0xfe) == Secp256k1::tapleaf_version);
			assert((cb[0] & 1) == commit.parity());
			assert(Bytes(cb.begin() + 1, cb.begin() + 33)
			    == Secp256k1::nums_key().to_bytes());
		}

		auto threw = false;
		try {
			(void) tree.merkle_path(6);
		} catch (Secp256k1::InvalidTapTree const&) {
			threw = true;
		}
		assert(threw);
	}

	/* Branch hashing does not depend on argument order.  */
	{
		auto a = Secp256k1::tapleaf_hash(Bytes{0x51});
		auto b = Secp256k1::tapleaf_hash(Bytes{0x52});
		assert(Secp256k1::tapbranch_hash(a, b) == Secp256k1::tapbranch_hash(b, a));
	}

	/* Schnorr signatures verify against the x-only key.  */
	{
		auto sk = Secp256k1::PrivKey();
		auto pk = Secp256k1::XonlyPubKey(sk);
		assert(std::string(pk) == "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
		auto m = Secp256k1::tapleaf_hash(Bytes{0x51});
		auto sig = Secp256k1::SchnorrSig::create(sk, m);
		assert(sig.valid(pk, m));
		assert(!sig.valid(pk, Secp256k1::tapleaf_hash(Bytes{0x52})));
		assert(!sig.valid(Secp256k1::nums_key(), m));
		assert(sig.to_bytes().size() == 64);
	}

	return 0;
}
