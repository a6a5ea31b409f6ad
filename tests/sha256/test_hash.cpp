#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include<algorithm>
#include<assert.h>
#include<sodium/core.h>
#include<stdexcept>
#include<vector>

namespace {

auto const hello = std::string("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

}

int main() {
	assert(sodium_init() >= 0);

	auto zero = Sha256::Hash();
	assert(!zero);
	assert(std::string(zero) == std::string(64, '0'));
	assert(Sha256::Hash(hello));
	assert(std::string(Sha256::Hash(hello)) == hello);

	auto threw = false;
	try {
		(void) Sha256::Hash("2cf2");
	} catch (std::invalid_argument const&) {
		threw = true;
	}
	assert(threw);
	threw = false;
	try {
		(void) Sha256::Hash(std::string(64, 'z'));
	} catch (std::invalid_argument const&) {
		threw = true;
	}
	assert(threw);

	/* From sha256sum.  */
	assert(Sha256::fun("hello", 5) == Sha256::Hash(hello));
	{
		auto hasher = Sha256::Hasher();
		hasher.feed("hel", 3);
		hasher.feed("lo", 2);
		assert(std::move(hasher).finalize() == Sha256::Hash(hello));
	}
	{
		/* Spans the stream's internal buffer.  */
		Sha256::HasherStream hs;
		hs << "the quick brown fox jumps over the lazy dog.";
		hs << "the quick brown fox jumps over the lazy dog.";
		assert( std::move(hs).finalize()
		     == Sha256::Hash("9d1b19cd5ff6fc857d99a4be13727f12b9bd6a78a1b8519e18737341d2e8f960")
		      );
	}

	/* A tagged hasher equals hashing the doubled tag hash
	 * by hand.
	 */
	{
		std::uint8_t th[32];
		Sha256::fun("TapLeaf", 7).to_buffer(th);
		auto manual = Sha256::Hasher();
		manual.feed(th, 32);
		manual.feed(th, 32);
		manual.feed("x", 1);
		auto expected = std::move(manual).finalize();

		auto tagged = Sha256::Hasher("TapLeaf");
		tagged.feed("x", 1);
		assert(std::move(tagged).finalize() == expected);

		Sha256::HasherStream hs("TapLeaf");
		hs << 'x';
		assert(std::move(hs).finalize() == expected);
	}

	/* Ordering is bytewise, as taproot branch sorting needs.  */
	auto a = Sha256::Hash("00ff" + std::string(60, '0'));
	auto b = Sha256::Hash("0100" + std::string(60, '0'));
	assert(a < b);
	assert(!(b < a));
	assert(!(a < a));
	auto v = std::vector<Sha256::Hash>{b, zero, a};
	std::sort(v.begin(), v.end());
	assert(v[0] == zero && v[1] == a && v[2] == b);

	return 0;
}
