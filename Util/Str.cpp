#include"Util/Str.hpp"
#include<iomanip>
#include<sstream>
#include<stdio.h>

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	std::ostringstream os;
	os << std::hex << std::setfill('0') << std::setw(2);
	/* uint8_t might be a char, which iostreams would print
	 * as a character; print the number instead.
	 */
	os << ((unsigned int) v);
	return os.str();
}

std::string hexdump(void const* vp, std::size_t s) {
	auto os = std::ostringstream();
	auto p = (std::uint8_t const*) vp;
	for (auto i = std::size_t(0); i < s; ++p, ++i)
		os << hexbyte(*p);
	return os.str();
}

namespace {

std::uint8_t parse_hex(char c) {
	if (('0' <= c) && (c <= '9'))
		return (std::uint8_t) (c & 0xF);
	if ((('a' <= c) && (c <= 'f')) || (('A' <= c) && (c <= 'F')))
		return (std::uint8_t) ((c + 9) & 0xF);
	throw HexParseFailure(std::string("Non-hex character: ") + c);
}

}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buf = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < buf.size(); ++i)
		buf[i] = (parse_hex(s[i * 2]) << 4)
		       | parse_hex(s[i * 2 + 1])
		       ;
	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	for (auto const& c : s) {
		if ( ('0' <= c && c <= '9')
		  || ('a' <= c && c <= 'f')
		  || ('A' <= c && c <= 'F')
		   )
			continue;
		return false;
	}
	return true;
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

std::string vfmt(char const* tpl, va_list ap) {
	va_list ap2;
	va_copy(ap2, ap);
	auto len = vsnprintf(nullptr, 0, tpl, ap2);
	va_end(ap2);
	if (len < 0)
		return std::string(tpl);

	auto buf = std::vector<char>(std::size_t(len) + 1);
	vsnprintf(buf.data(), buf.size(), tpl, ap);
	return std::string(buf.data(), std::size_t(len));
}

}}
