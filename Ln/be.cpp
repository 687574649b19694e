#include"Ln/be.hpp"

namespace {

template<typename T, std::size_t N>
void write_be(std::ostream& os, T v) {
	for (auto i = std::size_t(0); i < N; ++i)
		os.put(char((v >> (8 * (N - 1 - i))) & 0xFF));
}
template<typename T, std::size_t N>
void read_be(std::istream& is, T& v) {
	auto tmp = T(0);
	for (auto i = std::size_t(0); i < N; ++i) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof()) {
			is.setstate(std::ios_base::failbit);
			return;
		}
		tmp = T(tmp << 8) | T(std::uint8_t(c));
	}
	v = tmp;
}

}

namespace Ln { namespace Detail {

std::ostream& operator<<(std::ostream& os, Be16Const o) {
	write_be<std::uint16_t, 2>(os, o.v);
	return os;
}
std::istream& operator>>(std::istream& is, Be16 o) {
	read_be<std::uint16_t, 2>(is, o.v);
	return is;
}
std::ostream& operator<<(std::ostream& os, Be32Const o) {
	write_be<std::uint32_t, 4>(os, o.v);
	return os;
}
std::istream& operator>>(std::istream& is, Be32 o) {
	read_be<std::uint32_t, 4>(is, o.v);
	return is;
}
std::ostream& operator<<(std::ostream& os, Be64Const o) {
	write_be<std::uint64_t, 8>(os, o.v);
	return os;
}
std::istream& operator>>(std::istream& is, Be64 o) {
	read_be<std::uint64_t, 8>(is, o.v);
	return is;
}
std::ostream& operator<<(std::ostream& os, BeAmountConst o) {
	auto msat = o.v.to_msat();
	os << Ln::be(msat);
	return os;
}
std::istream& operator>>(std::istream& is, BeAmount o) {
	auto msat = std::uint64_t();
	is >> Ln::be(msat);
	if (is)
		o.v = Ln::Amount::msat(msat);
	return is;
}

}}

namespace Ln {

Detail::Be16 be(std::uint16_t& v) {
	return Detail::Be16(v);
}
Detail::Be16Const be(std::uint16_t const& v) {
	return Detail::Be16Const(v);
}
Detail::Be32 be(std::uint32_t& v) {
	return Detail::Be32(v);
}
Detail::Be32Const be(std::uint32_t const& v) {
	return Detail::Be32Const(v);
}
Detail::Be64 be(std::uint64_t& v) {
	return Detail::Be64(v);
}
Detail::Be64Const be(std::uint64_t const& v) {
	return Detail::Be64Const(v);
}
Detail::BeAmount be(Ln::Amount& v) {
	return Detail::BeAmount(v);
}
Detail::BeAmountConst be(Ln::Amount const& v) {
	return Detail::BeAmountConst(v);
}

}
