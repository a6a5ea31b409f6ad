#include"Bitcoin/varint.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/tagged_hashes.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sstream>

namespace {

struct Node {
	std::size_t weight;
	Sha256::Hash hash;
	std::vector<std::size_t> leaves;
};

auto const nums_hex = std::string(
	"50929b74c1a04954b78b4b6035e97a5e078a5a0f28ec96d547bfee9ace803ac0"
);

}

namespace Secp256k1 {

Sha256::Hash tapleaf_hash( std::vector<std::uint8_t> const& script
			 , std::uint8_t version
			 ) {
	auto os = std::ostringstream();
	os.put(char(version));
	os << Bitcoin::varbytes(script);
	auto s = os.str();
	return tagged_hash(Tag::LEAF, s.data(), s.size());
}

Sha256::Hash tapbranch_hash(Sha256::Hash const& a, Sha256::Hash const& b) {
	auto const& lo = b < a ? b : a;
	auto const& hi = b < a ? a : b;
	std::uint8_t buf[64];
	lo.to_buffer(&buf[0]);
	hi.to_buffer(&buf[32]);
	return tagged_hash(Tag::BRANCH, buf, sizeof(buf));
}

TapscriptTree::TapscriptTree(std::vector<std::vector<std::uint8_t>> scripts_)
	: scripts(std::move(scripts_)) {
	if (scripts.empty())
		throw InvalidTapTree("no leaves");

	paths.resize(scripts.size());
	auto nodes = std::vector<Node>();
	for (auto i = std::size_t(0); i < scripts.size(); ++i) {
		leaves.push_back(tapleaf_hash(scripts[i]));
		nodes.push_back(Node{1, leaves.back(), {i}});
	}

	while (nodes.size() > 1) {
		std::stable_sort( nodes.begin(), nodes.end()
				, [](Node const& x, Node const& y) {
			return x.weight > y.weight;
		});
		auto b = std::move(nodes.back());
		nodes.pop_back();
		auto a = std::move(nodes.back());
		nodes.pop_back();

		for (auto l : a.leaves)
			paths[l].push_back(b.hash);
		for (auto l : b.leaves)
			paths[l].push_back(a.hash);

		auto joined = Node{ a.weight + b.weight
				  , tapbranch_hash(a.hash, b.hash)
				  , std::move(a.leaves)
				  };
		joined.leaves.insert( joined.leaves.end()
				    , b.leaves.begin(), b.leaves.end()
				    );
		nodes.push_back(std::move(joined));
	}
	root_hash = nodes[0].hash;
}

std::vector<std::uint8_t> const& TapscriptTree::script(std::size_t i) const {
	if (i >= scripts.size())
		throw InvalidTapTree(Util::Str::fmt("no leaf %zu", i));
	return scripts[i];
}
Sha256::Hash const& TapscriptTree::leaf_hash(std::size_t i) const {
	if (i >= leaves.size())
		throw InvalidTapTree(Util::Str::fmt("no leaf %zu", i));
	return leaves[i];
}
std::vector<Sha256::Hash> const&
TapscriptTree::merkle_path(std::size_t i) const {
	if (i >= paths.size())
		throw InvalidTapTree(Util::Str::fmt("no leaf %zu", i));
	return paths[i];
}

std::size_t
TapscriptTree::find(std::vector<std::uint8_t> const& script) const {
	return std::find(scripts.begin(), scripts.end(), script)
	     - scripts.begin()
	     ;
}

XonlyPubKey nums_key() {
	return XonlyPubKey(nums_hex);
}

namespace {

XonlyPubKey tweak( XonlyPubKey const& internal
		 , TapscriptTree const& tree
		 , int& parity
		 ) {
	std::uint8_t buf[64];
	internal.to_buffer(&buf[0]);
	tree.root().to_buffer(&buf[32]);
	auto t = tagged_hash(Tag::TWEAK, buf, sizeof(buf));
	return internal.tweak_add(t, parity);
}

}

TaprootCommitment::TaprootCommitment( XonlyPubKey internal_
				    , TapscriptTree tree_
				    ) : internal(std::move(internal_))
				      , taptree(std::move(tree_))
				      , output(internal)
				      , output_parity(0) {
	output = tweak(internal, taptree, output_parity);
}

std::vector<std::uint8_t>
TaprootCommitment::control_block(std::size_t leaf) const {
	auto const& path = taptree.merkle_path(leaf);
	auto rv = std::vector<std::uint8_t>(33 + 32 * path.size());
	rv[0] = std::uint8_t(tapleaf_version | (output_parity & 1));
	internal.to_buffer(&rv[1]);
	for (auto i = std::size_t(0); i < path.size(); ++i)
		path[i].to_buffer(&rv[33 + 32 * i]);
	return rv;
}

std::vector<std::uint8_t> TaprootCommitment::pk_script() const {
	auto rv = std::vector<std::uint8_t>(34);
	rv[0] = 0x51;
	rv[1] = 0x20;
	output.to_buffer(&rv[2]);
	return rv;
}

}
