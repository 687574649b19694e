#ifndef ROUTER_CHANNELGRAPH_HPP
#define ROUTER_CHANNELGRAPH_HPP

#include"Ln/ChannelUpdate.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"
#include<cstddef>
#include<memory>
#include<vector>

namespace Router {

/** struct Router::ChannelEdge
 *
 * @brief one direction of a channel, with the last
 * forwarding policy announced for that direction.
 */
struct ChannelEdge {
	Ln::Scid channel;
	Ln::NodeId from;
	Ln::NodeId to;
	Ln::ChannelUpdate policy;
};

/** class Router::ChannelGraph
 *
 * @brief in-memory directed multigraph of the
 * channels known to the router, shared by all
 * payments.
 *
 * @desc Direction 0 of a channel goes from node_1
 * to node_2.
 * A direction becomes routable once a policy update
 * for it has been applied.
 *
 * All member functions may be called concurrently.
 * Adding and removing channels takes the index lock
 * exclusively; everything else takes it shared, and
 * policy updates serialize on a per-channel lock.
 */
class ChannelGraph {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	ChannelGraph();
	ChannelGraph(ChannelGraph&&);
	~ChannelGraph();

	/** Router::ChannelGraph::add_channel
	 *
	 * @brief registers a channel between two nodes.
	 * Returns false if the channel is already known
	 * or both ends are the same node.
	 */
	bool add_channel( Ln::Scid channel
			, Ln::NodeId const& node_1
			, Ln::NodeId const& node_2
			);
	/* Returns false if the channel was not known.  */
	bool remove_channel(Ln::Scid channel);

	/** Router::ChannelGraph::apply_update
	 *
	 * @brief applies the policy update to its channel
	 * direction if its timestamp is strictly newer
	 * than the stored one.
	 *
	 * @desc Updates for unknown channels and stale
	 * updates are discarded; returns whether the
	 * update was applied.
	 */
	bool apply_update(Ln::ChannelUpdate const& update);

	/* Enabled, routable edges leaving the node.  */
	std::vector<ChannelEdge> edges_from(Ln::NodeId const& node) const;
	/* Enabled, routable edges entering the node.  */
	std::vector<ChannelEdge> edges_to(Ln::NodeId const& node) const;

	/** Router::ChannelGraph::find_edge
	 *
	 * @brief returns the direction of the channel
	 * leaving `from`, disabled or not, or nullptr if
	 * the channel is unknown, does not touch `from`,
	 * or has no policy for that direction.
	 */
	std::unique_ptr<ChannelEdge>
	find_edge(Ln::Scid channel, Ln::NodeId const& from) const;

	bool has_channel(Ln::Scid channel) const;
	std::size_t num_channels() const;
};

}

#endif /* !defined(ROUTER_CHANNELGRAPH_HPP) */
