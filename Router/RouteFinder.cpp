#include"Graph/Dijkstra.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Config.hpp"
#include"Router/Error.hpp"
#include"Router/RouteFinder.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<map>
#include<queue>
#include<vector>

namespace {

/* BOLT-4 onions have room for 20 hops.  */
auto const max_hops = std::uint32_t(20);

auto const no_parent = std::size_t(-1);

/* A partial route from some node to the destination.
 * `amount` is what must arrive at `node` for the rest
 * of the route; `via` is the channel leaving `node`
 * toward the destination.  */
struct Label {
	Ln::NodeId node;
	double weight;
	Ln::Amount fee;
	std::uint32_t cltv;
	std::uint32_t hops;
	Ln::Amount amount;
	Ln::Scid via;
	std::size_t parent;
	bool dead;
};

/* Whether `a` makes `b` useless: `a` is no worse on
 * every measure the ranking and the budgets look at.  */
bool dominates(Label const& a, Label const& b) {
	if (a.weight > b.weight)
		return false;
	return a.fee <= b.fee
	    && a.cltv <= b.cltv
	    && a.hops <= b.hops
	     ;
}

/* Orders label indices so the priority queue pops the
 * lowest weight first, then the lowest fee, then the
 * fewest hops.  */
class CmpLabel {
private:
	std::vector<Label> const* labels;
public:
	explicit
	CmpLabel(std::vector<Label> const& labels_) : labels(&labels_) { }
	bool operator()(std::size_t ia, std::size_t ib) const {
		auto const& a = (*labels)[ia];
		auto const& b = (*labels)[ib];
		/* std::priority_queue pops the highest, so
		 * flip the comparison.  */
		if (a.weight != b.weight)
			return b.weight < a.weight;
		if (a.fee != b.fee)
			return b.fee < a.fee;
		return b.hops < a.hops;
	}
};

typedef Graph::Dijkstra< Ln::NodeId
		       , std::uint64_t
		       > Dijkstra;

/* Least total CLTV delta from the source to each node
 * it can reach, honoring the query exclusions.  */
std::map<Ln::NodeId, std::uint64_t>
min_cltv_from_source( Router::ChannelGraph const& graph
		    , Router::RouteQuery const& q
		    ) {
	auto dijkstra = Dijkstra(q.source, 0);
	while (auto current = dijkstra.current()) {
		auto v = *current;
		if ( v != q.source
		  && v != q.destination
		  && q.excluded_nodes.count(v) != 0
		   ) {
			dijkstra.end_neighbors();
			continue;
		}
		for (auto const& e : graph.edges_from(v)) {
			if (q.excluded_channels.count(e.channel) != 0)
				continue;
			if ( v == q.source
			  && q.required_first_hop
			  && e.channel != q.required_first_hop
			   )
				continue;
			dijkstra.neighbor(e.to, e.policy.time_lock_delta);
		}
		dijkstra.end_neighbors();
	}

	auto rv = std::map<Ln::NodeId, std::uint64_t>();
	auto tree = std::move(dijkstra).finalize();
	for (auto const& n : tree)
		rv[n.first] = n.second->data.second;
	return rv;
}

}

namespace Router {

Ln::Route RouteFinder::find_route(RouteQuery const& q) const {
	if (!q.source || !q.destination)
		throw ClientConstraintError(
			"RouteFinder: source and destination required"
		);
	if (q.source == q.destination)
		throw ClientConstraintError(
			"RouteFinder: source is the destination"
		);

	if (q.required_first_hop) {
		auto e = graph.find_edge(q.required_first_hop, q.source);
		if (!e)
			throw NoRouteError(Util::Str::fmt(
				"required channel %s does not leave the sender",
				std::string(q.required_first_hop).c_str()
			));
		if (e->policy.disabled())
			throw NoRouteError(Util::Str::fmt(
				"required channel %s is disabled",
				std::string(q.required_first_hop).c_str()
			));
		if (q.excluded_channels.count(q.required_first_hop) != 0)
			throw NoRouteError(Util::Str::fmt(
				"required channel %s was excluded",
				std::string(q.required_first_hop).c_str()
			));
	}

	auto const risk = config.risk_factor();
	auto const attempt_cost = double(config.attempt_cost_msat());

	auto const no_route = [&q]() {
		return NoRouteError(Util::Str::fmt(
			"no route to %s for %s",
			std::string(q.destination).c_str(),
			std::string(q.amount).c_str()
		));
	};

	auto const reach = min_cltv_from_source(graph, q);
	if (reach.find(q.destination) == reach.end())
		throw no_route();

	auto labels = std::vector<Label>();
	/* Live labels per node.  */
	auto fronts = std::map<Ln::NodeId, std::vector<std::size_t>>();
	auto queue = std::priority_queue< std::size_t
					, std::vector<std::size_t>
					, CmpLabel
					>(CmpLabel(labels));

	auto root = Label();
	root.node = q.destination;
	root.weight = 0;
	root.cltv = 0;
	root.hops = 0;
	root.amount = q.amount;
	root.parent = no_parent;
	root.dead = false;
	labels.push_back(root);
	fronts[q.destination].push_back(0);
	queue.push(0);

	auto found = no_parent;
	while (!queue.empty()) {
		auto i = queue.top();
		queue.pop();
		if (labels[i].dead)
			continue;
		if (labels[i].node == q.source) {
			found = i;
			break;
		}
		/* Copy: pushing labels below may reallocate.  */
		auto const cur = labels[i];
		if (cur.hops >= max_hops)
			continue;
		/* Intermediate nodes excluded for this payment
		 * cannot forward.  */
		if ( cur.node != q.destination
		  && q.excluded_nodes.count(cur.node) != 0
		   )
			continue;

		for (auto const& e : graph.edges_to(cur.node)) {
			auto const& u = e.from;
			if (q.excluded_channels.count(e.channel) != 0)
				continue;
			if (u != q.source && q.excluded_nodes.count(u) != 0)
				continue;
			if ( u == q.source
			  && q.required_first_hop
			  && e.channel != q.required_first_hop
			   )
				continue;
			auto rit = reach.find(u);
			if (rit == reach.end())
				continue;

			auto fee = e.policy.fee(cur.amount);
			auto carried = cur.amount + fee;
			if (!e.policy.accepts(carried))
				continue;
			if (cur.fee + fee > q.fee_budget)
				continue;
			auto delta = std::uint64_t(e.policy.time_lock_delta);
			/* The part still to be found, from the source
			 * to `u`, needs at least `rit->second`.  */
			if ( std::uint64_t(cur.cltv) + delta + rit->second
			   > std::uint64_t(q.cltv_budget)
			   )
				continue;

			auto l = Label();
			l.node = u;
			l.weight = cur.weight
				 + double(fee.to_msat())
				 + attempt_cost
				 + double(carried.to_msat())
				 * double(delta)
				 * risk
				 / 1e9
				 ;
			l.fee = cur.fee + fee;
			l.cltv = std::uint32_t(cur.cltv + delta);
			l.hops = cur.hops + 1;
			l.amount = carried;
			l.via = e.channel;
			l.parent = i;
			l.dead = false;

			auto& front = fronts[u];
			auto beaten = std::any_of( front.begin(), front.end()
						 , [&](std::size_t j) {
				return dominates(labels[j], l);
			});
			if (beaten)
				continue;
			front.erase(std::remove_if( front.begin(), front.end()
						  , [&](std::size_t j) {
				if (!dominates(l, labels[j]))
					return false;
				labels[j].dead = true;
				return true;
			}), front.end());

			auto j = labels.size();
			labels.push_back(std::move(l));
			front.push_back(j);
			queue.push(j);
		}
	}
	if (found == no_parent)
		throw no_route();

	/* Walk from the source toward the destination
	 * (the root label).  */
	auto route = Ln::Route();
	for ( auto i = found
	    ; labels[i].parent != no_parent
	    ; i = labels[i].parent
	    ) {
		auto const& l = labels[i];
		auto const& parent = labels[l.parent];
		auto hop = Ln::Hop();
		hop.channel = l.via;
		hop.node = parent.node;
		hop.amount = l.amount;
		hop.fee = l.fee - parent.fee;
		hop.cltv_delta = l.cltv - parent.cltv;
		route.hops.push_back(std::move(hop));
	}
	if (route.empty() || route.destination() != q.destination)
		throw InternalError("RouteFinder: search does not reach destination");
	return route;
}

}
