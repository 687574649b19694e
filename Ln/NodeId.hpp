#ifndef LN_NODEID_HPP
#define LN_NODEID_HPP

#include<array>
#include<cstdint>
#include<iostream>
#include<string>

namespace Ln {

/** class Ln::NodeId
 *
 * @brief the 33-byte compressed public key that
 * names a node in the channel graph.
 *
 * @desc Held by value, so copies never allocate.
 * A default-constructed NodeId is the null node
 * (all zero bytes), which is false in boolean
 * context and sorts before every real node.
 */
class NodeId {
private:
	std::array<std::uint8_t, 33> raw;

public:
	NodeId() : raw() { }
	explicit
	NodeId(std::string const&);

	/* Whether the string is 66 hex digits of a
	 * compressed key, or all zeros.  */
	static bool valid_string(std::string const&);

	/* A buffer with a zero first byte gives the null
	 * node.  */
	static
	NodeId from_buffer(std::uint8_t const buf[33]);
	void to_buffer(std::uint8_t buf[33]) const;

	explicit
	operator std::string() const;

	explicit
	operator bool() const { return raw[0] != 0; }
	bool operator!() const { return !bool(*this); }

	bool operator==(NodeId const& o) const {
		return raw == o.raw;
	}
	bool operator!=(NodeId const& o) const {
		return !(*this == o);
	}
	bool operator<(NodeId const& o) const {
		return raw < o.raw;
	}
	bool operator>(NodeId const& o) const {
		return (o < *this);
	}
	bool operator<=(NodeId const& o) const {
		return !(*this > o);
	}
	bool operator>=(NodeId const& o) const {
		return (o <= *this);
	}
};

std::istream& operator>>(std::istream&, NodeId&);
std::ostream& operator<<(std::ostream&, NodeId const&);

}

#endif /* LN_NODEID_HPP */
