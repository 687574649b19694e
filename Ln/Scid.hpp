#ifndef LN_SCID_HPP
#define LN_SCID_HPP

#include<cstddef>
#include<cstdint>
#include<iostream>
#include<string>

namespace Ln {

/** class Ln::Scid
 *
 * @brief short channel ID, identifying a channel by
 * the location of its funding output on the chain.
 *
 * @desc The null Scid (integer 0) means "no channel".
 */
class Scid {
private:
	/* Most significant 3 bytes = block height.
	 * Next 3 bytes = transaction index.
	 * Lowest 2 bytes = output index.
	 */
	std::uint64_t val;

public:
	Scid(std::nullptr_t _ = nullptr) : val(0) { }
	Scid(Scid const&) =default;
	Scid& operator=(Scid const&) =default;
	~Scid() =default;

	/* Conversion from/to the packed 64-bit form used
	 * on the wire and in RPC messages.  */
	static
	Scid from_u64(std::uint64_t v) {
		auto ret = Scid();
		ret.val = v;
		return ret;
	}
	std::uint64_t to_u64() const {
		return val;
	}
	static
	Scid make(std::uint32_t block, std::uint32_t txindex, std::uint16_t outnum);

	std::uint32_t block() const {
		return std::uint32_t((val >> 40) & 0xFFFFFF);
	}
	std::uint32_t txindex() const {
		return std::uint32_t((val >> 16) & 0xFFFFFF);
	}
	std::uint16_t outnum() const {
		return std::uint16_t(val & 0xFFFF);
	}

	explicit
	operator bool() const {
		return val != 0;
	}
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Scid const& i) const {
		return val == i.val;
	}
	bool operator!=(Scid const& i) const {
		return !(*this == i);
	}
	/* For key of maps and sets.  */
	bool operator<(Scid const& i) const {
		return val < i.val;
	}
	bool operator>(Scid const& i) const {
		return i < *this;
	}
	bool operator<=(Scid const& i) const {
		return !(*this > i);
	}
	bool operator>=(Scid const& i) const {
		return (i <= *this);
	}

	explicit
	operator std::string() const;
	explicit
	Scid(std::string const&);

	static
	bool valid_string(std::string const&);
};

inline
std::istream& operator>>(std::istream& is, Scid& chan) {
	auto s = std::string();
	is >> s;
	chan = Scid(s);
	return is;
}
inline
std::ostream& operator<<(std::ostream& os, Scid const& chan) {
	return os << std::string(chan);
}

}

#endif /* !defined(LN_SCID_HPP) */
