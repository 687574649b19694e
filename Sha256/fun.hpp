#ifndef SHA256_FUN_HPP
#define SHA256_FUN_HPP

#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include<string>
#include<vector>

namespace Sha256 {

inline
Sha256::Hash fun(void const* p, std::size_t len) {
	auto hasher = Sha256::Hasher();
	hasher.feed(p, len);
	return std::move(hasher).finalize();
}
inline
Sha256::Hash fun(std::vector<std::uint8_t> const& data) {
	return fun(data.empty() ? nullptr : &data[0], data.size());
}
inline
Sha256::Hash fun(std::string const& data) {
	return fun(data.data(), data.size());
}

}

#endif /* !defined(SHA256_FUN_HPP) */
