#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>

namespace {

auto const bech32_chars = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

int decode_char(char c) {
	auto it = std::find( bech32_chars.begin(), bech32_chars.end()
			   , char(tolower(c))
			   );
	if (it == bech32_chars.end())
		return -1;
	return int(it - bech32_chars.begin());
}

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	static std::uint32_t const gen[5] =
	{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= gen[i];
	}
	return chk;
}

std::vector<std::uint8_t> hrp_expand(std::string const& hrp) {
	auto rv = std::vector<std::uint8_t>();
	rv.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) >> 5);
	rv.push_back(0);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) & 0x1F);
	return rv;
}

}

namespace Util { namespace Bech32 {

bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& words
	   , std::string const& bech32
	   ) {
	auto has_lower = std::any_of( bech32.begin(), bech32.end()
				    , [](char c) { return islower(c); }
				    );
	auto has_upper = std::any_of( bech32.begin(), bech32.end()
				    , [](char c) { return isupper(c); }
				    );
	if (has_lower && has_upper)
		return false;

	/* The last `1` character is the separator.  */
	auto rit = std::find(bech32.rbegin(), bech32.rend(), '1');
	if (rit == bech32.rend())
		return false;
	/* `it` points to the separator.  */
	auto it = rit.base() - 1;
	if (it == bech32.begin())
		return false;
	/* Data part must at least hold the checksum.  */
	if (bech32.end() - (it + 1) < 6)
		return false;

	auto new_hrp = std::string();
	for (auto p = bech32.begin(); p != it; ++p) {
		if (*p < 33 || *p > 126)
			return false;
		new_hrp.push_back(char(tolower(*p)));
	}

	auto values = std::vector<std::uint8_t>();
	for (auto p = it + 1; p != bech32.end(); ++p) {
		auto val = decode_char(*p);
		if (val < 0)
			return false;
		values.push_back(std::uint8_t(val));
	}

	auto check = hrp_expand(new_hrp);
	check.insert(check.end(), values.begin(), values.end());
	if (polymod(check) != 1)
		return false;

	hrp = std::move(new_hrp);
	words.assign(values.begin(), values.end() - 6);
	return true;
}

std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& words
		  ) {
	auto values = hrp_expand(hrp);
	values.insert(values.end(), words.begin(), words.end());
	values.insert(values.end(), 6, std::uint8_t(0));
	auto mod = polymod(values) ^ 1;

	auto rv = hrp + "1";
	for (auto w : words)
		rv.push_back(bech32_chars[w & 0x1F]);
	for (auto i = 0; i < 6; ++i)
		rv.push_back(bech32_chars[(mod >> (5 * (5 - i))) & 0x1F]);
	return rv;
}

}}
