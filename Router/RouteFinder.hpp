#ifndef ROUTER_ROUTEFINDER_HPP
#define ROUTER_ROUTEFINDER_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Route.hpp"
#include"Ln/Scid.hpp"
#include<cstdint>
#include<set>

namespace Router { class ChannelGraph; }
namespace Router { class Config; }

namespace Router {

/** struct Router::RouteQuery
 *
 * @brief the constraints of one route search.
 *
 * @desc `fee_budget` and `cltv_budget` are hard
 * ceilings on the sum of hop fees and the sum of hop
 * CLTV deltas.
 * A null `required_first_hop` leaves the first
 * channel free.
 */
struct RouteQuery {
	Ln::NodeId source;
	Ln::NodeId destination;
	Ln::Amount amount;
	Ln::Amount fee_budget = Ln::Amount::max();
	std::uint32_t cltv_budget = UINT32_MAX;
	std::set<Ln::Scid> excluded_channels;
	std::set<Ln::NodeId> excluded_nodes;
	Ln::Scid required_first_hop;
};

/** class Router::RouteFinder
 *
 * @brief constrained shortest-path search over the
 * channel graph.
 *
 * @desc The search runs backward from the
 * destination, so the amount each hop must carry
 * (the destination amount plus the fees of every
 * later hop) is known when the hop is considered.
 * Routes are ranked by a weight combining fees, a
 * per-hop attempt cost, and the time-lock risk of
 * the carried amount; ties go to the lower total fee,
 * then the fewer hops.
 *
 * A node keeps every partial route to it that no
 * other partial route matches or beats on weight,
 * fee, CLTV and hop count, so a cheaper route that
 * breaks a budget never hides a costlier one that
 * fits.
 */
class RouteFinder {
private:
	ChannelGraph const& graph;
	Config const& config;

public:
	RouteFinder( ChannelGraph const& graph_
		   , Config const& config_
		   ) : graph(graph_), config(config_) { }

	/** Router::RouteFinder::find_route
	 *
	 * @brief returns the best route satisfying the
	 * query.
	 *
	 * @desc Throws Router::NoRouteError if there is
	 * none, and Router::ClientConstraintError if the
	 * source is the destination or either is missing.
	 */
	Ln::Route find_route(RouteQuery const& query) const;
};

}

#endif /* !defined(ROUTER_ROUTEFINDER_HPP) */
