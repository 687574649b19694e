#ifndef LN_ROUTE_HPP
#define LN_ROUTE_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"
#include<cstdint>
#include<iostream>
#include<vector>

namespace Ln {

/** struct Ln::Hop
 *
 * @brief one channel traversed by a payment.
 *
 * @desc `amount` is what is carried over `channel`
 * into `node`; `fee` and `cltv_delta` are what the
 * channel's forwarding policy charges for it.
 */
struct Hop {
	Ln::Scid channel;
	Ln::NodeId node;
	Ln::Amount amount;
	Ln::Amount fee;
	std::uint32_t cltv_delta;

	bool operator==(Hop const& o) const {
		return channel == o.channel
		    && node == o.node
		    && amount == o.amount
		    && fee == o.fee
		    && cltv_delta == o.cltv_delta
		     ;
	}
	bool operator!=(Hop const& o) const {
		return !(*this == o);
	}
};

/** struct Ln::Route
 *
 * @brief an ordered sequence of hops from the sender
 * to the destination.
 *
 * @desc The first hop carries the destination
 * amount plus every fee; the last hop reaches the
 * destination.
 */
struct Route {
	std::vector<Hop> hops;

	bool empty() const { return hops.empty(); }

	Ln::Amount total_fees() const {
		auto rv = Ln::Amount();
		for (auto const& h : hops)
			rv += h.fee;
		return rv;
	}
	std::uint32_t total_cltv() const {
		auto rv = std::uint32_t(0);
		for (auto const& h : hops)
			rv += h.cltv_delta;
		return rv;
	}
	/* What the sender commits to the first hop.  */
	Ln::Amount total_amount() const {
		if (hops.empty())
			return Ln::Amount();
		return hops.front().amount;
	}
	Ln::NodeId destination() const {
		if (hops.empty())
			return Ln::NodeId();
		return hops.back().node;
	}

	bool operator==(Route const& o) const {
		return hops == o.hops;
	}
	bool operator!=(Route const& o) const {
		return !(*this == o);
	}
};

/* "<scid>-><node> ..." for logs.  */
std::ostream& operator<<(std::ostream&, Route const&);

}

#endif /* !defined(LN_ROUTE_HPP) */
