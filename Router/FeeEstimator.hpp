#ifndef ROUTER_FEEESTIMATOR_HPP
#define ROUTER_FEEESTIMATOR_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Router/RouteFinder.hpp"
#include<cstdint>

namespace Router {

/** class Router::FeeEstimator
 *
 * @brief estimates what paying a destination would
 * cost, without dispatching anything.
 *
 * @desc The estimate is the cost of the route the
 * finder would pick with unlimited budgets.
 * `time_lock_delay` is the sum of the hop CLTV
 * deltas; the destination's own final CLTV delta is
 * for the caller to add.
 */
class FeeEstimator {
private:
	RouteFinder finder;
	Ln::NodeId self;

public:
	struct Estimate {
		Ln::Amount routing_fee;
		std::uint32_t time_lock_delay;
	};

	FeeEstimator( ChannelGraph const& graph
		    , Config const& config
		    , Ln::NodeId self_
		    ) : finder(graph, config), self(std::move(self_)) { }

	/* Throws Router::NoRouteError if the destination
	 * cannot be reached.  */
	Estimate estimate( Ln::NodeId const& destination
			 , Ln::Amount amount
			 ) const;
};

}

#endif /* !defined(ROUTER_FEEESTIMATOR_HPP) */
