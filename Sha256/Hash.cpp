#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = {0};

}

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}
Hash::Hash(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Sha256::Hash: hashes must be 64 hex digits."
		);
	auto bytes = Util::Str::hexread(s);
	from_buffer(&bytes[0]);
}

Hash::operator std::string() const {
	if (!pimpl)
		return Util::Str::hexdump(zero, 32);
	return Util::Str::hexdump(pimpl->d, 32);
}
Hash::operator bool() const {
	if (!pimpl)
		return false;
	return 0 != sodium_memcmp(zero, pimpl->d, 32);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return 0 == sodium_memcmp(a, b, 32);
}

}
