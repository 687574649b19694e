#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

namespace Ln {

/* Amounts are written in millisatoshi with an explicit
 * `msat` suffix.
 */
bool Amount::valid_string(std::string const& s) {
	if (s.size() < 5)
		return false;
	if (std::string(s.end() - 4, s.end()) != "msat")
		return false;
	bool flag = std::all_of( s.begin(), s.end() - 4
			       , [](char c) { return '0' <= c && c <= '9'; }
			       );
	if (!flag)
		return false;
	/* UINT64_MAX is 20 digits; the "4" is "msat".  */
	if (s.size() > 20 + 4)
		return false;
	if (s.size() == 20 + 4 && std::string(s.begin(), s.end() - 4)
				  > "18446744073709551615")
		return false;
	return true;
}

Amount::Amount(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Ln::Amount string invalid."
		);
	auto is = std::istringstream(std::string(s.begin(), s.end() - 4));
	is >> v;
}
Amount::operator std::string() const {
	auto os = std::ostringstream();
	os << v << "msat";
	return os.str();
}

Amount Amount::ppm(std::uint32_t rate) const {
	auto q = v / 1000000;
	auto r = v % 1000000;
	/* r * rate < 10^6 * 2^32, no overflow.  */
	auto low = (r * rate) / 1000000;
	auto high = q * rate;
	if (rate != 0 && high / rate != q)
		return Amount::max();
	return Amount::msat(high) + Amount::msat(low);
}

}
