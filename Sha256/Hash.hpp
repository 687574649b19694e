#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstdint>
#include<cstring>
#include<iostream>
#include<memory>
#include<string>
#include<utility>

namespace Sha256 { class Hasher; }

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA-256 digest.
 *
 * @desc A default-constructed hash is all zeroes
 * and is false in a boolean context.
 * Comparison is constant-time.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[32];
	};
	std::shared_ptr<Impl> pimpl;

	explicit
	Hash(std::uint8_t const d[32]) {
		from_buffer(d);
	}

	friend class Sha256::Hasher;
	friend struct std::hash<Hash>;

public:
	Hash() =default;
	Hash(Hash const&) =default;
	Hash(Hash&&) =default;
	Hash& operator=(Hash const&) =default;
	Hash& operator=(Hash&&) =default;
	~Hash() =default;

	static
	bool valid_string(std::string const&);
	explicit
	Hash(std::string const&);

	explicit
	operator std::string() const;

	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& i) const {
		return !(*this == i);
	}

	void to_buffer(std::uint8_t d[32]) const {
		if (pimpl)
			std::memcpy(d, pimpl->d, 32);
		else
			std::memset(d, 0, 32);
	}
	void from_buffer(std::uint8_t const d[32]) {
		pimpl = std::make_shared<Impl>();
		std::memcpy(pimpl->d, d, 32);
	}
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& i) {
	return os << std::string(i);
}

}

/* For use with std::unordered_map.  */
namespace std {
	template<>
	struct hash<::Sha256::Hash> {
		std::size_t operator()(::Sha256::Hash const& i) const {
			if (!i.pimpl)
				return 0;
			/* Already a hash, so just read it as-is.  */
			auto rv = std::size_t();
			std::memcpy(&rv, i.pimpl->d, sizeof(rv));
			return rv;
		}
	};
}

#endif /* !defined(SHA256_HASH_HPP) */
