#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<string>
#include<vector>

namespace {

auto const hello = Sha256::Hash("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

}

int main() {
	/* From sha256sum.  */
	assert(Sha256::fun("hello", 5) == hello);
	assert(Sha256::fun(std::string("hello")) == hello);
	assert(Sha256::fun(std::vector<std::uint8_t>{'h', 'e', 'l', 'l', 'o'}) == hello);
	assert( Sha256::fun(std::string())
	     == Sha256::Hash("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855")
	      );

	auto hasher = Sha256::Hasher();
	assert(hasher);
	hasher.feed("hel", 3);
	hasher.feed("lo", 2);
	assert(hasher.get() == hello);

	/* Copies keep the midstate.  */
	auto copy = hasher;
	assert(std::move(hasher).finalize() == hello);
	assert(!hasher);
	copy.feed("!", 1);
	assert(std::move(copy).finalize() != hello);

	/* More than one 64-byte block.  */
	{
		auto h = Sha256::Hasher();
		auto s = std::string("the quick brown fox jumps over the lazy dog.");
		h.feed(s.data(), s.size());
		h.feed(s.data(), s.size());
		assert( std::move(h).finalize()
		     == Sha256::Hash("9d1b19cd5ff6fc857d99a4be13727f12b9bd6a78a1b8519e18737341d2e8f960")
		      );
	}

	return 0;
}
