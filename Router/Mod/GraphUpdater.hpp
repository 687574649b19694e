#ifndef ROUTER_MOD_GRAPHUPDATER_HPP
#define ROUTER_MOD_GRAPHUPDATER_HPP

namespace Router { class ChannelGraph; }
namespace S { class Bus; }

namespace Router { namespace Mod {

/** class Router::Mod::GraphUpdater
 *
 * @brief applies the announcements, policy updates,
 * and closures raised by the graph feed to the
 * shared channel graph.
 */
class GraphUpdater {
private:
	S::Bus& bus;
	Router::ChannelGraph& graph;

	void start();

public:
	GraphUpdater() =delete;
	GraphUpdater(GraphUpdater const&) =delete;

	GraphUpdater( S::Bus& bus_
		    , Router::ChannelGraph& graph_
		    ) : bus(bus_), graph(graph_) { start(); }
};

}}

#endif /* !defined(ROUTER_MOD_GRAPHUPDATER_HPP) */
