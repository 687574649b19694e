#include"Router/ChannelGraph.hpp"
#include"Util/make_unique.hpp"
#include<map>
#include<mutex>
#include<set>
#include<shared_mutex>

namespace Router {

class ChannelGraph::Impl {
private:
	struct Channel {
		Ln::Scid scid;
		Ln::NodeId node[2];
		/* Guards `known` and `policy`.  */
		std::mutex mut;
		bool known[2];
		Ln::ChannelUpdate policy[2];
	};

	mutable std::shared_mutex index_mut;
	std::map<Ln::Scid, std::shared_ptr<Channel>> channels;
	std::map<Ln::NodeId, std::set<Ln::Scid>> by_node;

	/* Must hold index_mut.  */
	std::shared_ptr<Channel> lookup(Ln::Scid scid) const {
		auto it = channels.find(scid);
		if (it == channels.end())
			return nullptr;
		return it->second;
	}

	/* Must hold the channel lock.  */
	static
	std::unique_ptr<ChannelEdge> edge(Channel const& ch, int dir) {
		if (!ch.known[dir])
			return nullptr;
		auto rv = Util::make_unique<ChannelEdge>();
		rv->channel = ch.scid;
		rv->from = ch.node[dir];
		rv->to = ch.node[1 - dir];
		rv->policy = ch.policy[dir];
		return rv;
	}

	/* Collects the enabled edges of the channels at
	 * `node`, taking direction `outgoing ? node is
	 * the source : node is the target`.  */
	std::vector<ChannelEdge>
	collect(Ln::NodeId const& node, bool outgoing) const {
		auto rv = std::vector<ChannelEdge>();
		auto lock = std::shared_lock<std::shared_mutex>(index_mut);
		auto it = by_node.find(node);
		if (it == by_node.end())
			return rv;
		for (auto const& scid : it->second) {
			auto ch = lookup(scid);
			if (!ch)
				continue;
			auto dir = (ch->node[0] == node) ? 0 : 1;
			if (!outgoing)
				dir = 1 - dir;
			auto chlock = std::unique_lock<std::mutex>(ch->mut);
			auto e = edge(*ch, dir);
			if (!e || e->policy.disabled())
				continue;
			rv.push_back(std::move(*e));
		}
		return rv;
	}

public:
	bool add_channel( Ln::Scid scid
			, Ln::NodeId const& node_1
			, Ln::NodeId const& node_2
			) {
		if (!scid || !node_1 || !node_2 || node_1 == node_2)
			return false;
		auto lock = std::unique_lock<std::shared_mutex>(index_mut);
		if (channels.find(scid) != channels.end())
			return false;
		auto ch = std::make_shared<Channel>();
		ch->scid = scid;
		ch->node[0] = node_1;
		ch->node[1] = node_2;
		ch->known[0] = false;
		ch->known[1] = false;
		channels.emplace(scid, std::move(ch));
		by_node[node_1].insert(scid);
		by_node[node_2].insert(scid);
		return true;
	}
	bool remove_channel(Ln::Scid scid) {
		auto lock = std::unique_lock<std::shared_mutex>(index_mut);
		auto it = channels.find(scid);
		if (it == channels.end())
			return false;
		for (auto const& n : it->second->node) {
			auto nit = by_node.find(n);
			if (nit == by_node.end())
				continue;
			nit->second.erase(scid);
			if (nit->second.empty())
				by_node.erase(nit);
		}
		channels.erase(it);
		return true;
	}

	bool apply_update(Ln::ChannelUpdate const& u) {
		auto lock = std::shared_lock<std::shared_mutex>(index_mut);
		auto ch = lookup(u.chan_id);
		if (!ch)
			return false;
		auto dir = u.direction();
		auto chlock = std::unique_lock<std::mutex>(ch->mut);
		if (ch->known[dir] && u.timestamp <= ch->policy[dir].timestamp)
			return false;
		ch->known[dir] = true;
		ch->policy[dir] = u;
		return true;
	}

	std::vector<ChannelEdge> edges_from(Ln::NodeId const& node) const {
		return collect(node, true);
	}
	std::vector<ChannelEdge> edges_to(Ln::NodeId const& node) const {
		return collect(node, false);
	}

	std::unique_ptr<ChannelEdge>
	find_edge(Ln::Scid scid, Ln::NodeId const& from) const {
		auto lock = std::shared_lock<std::shared_mutex>(index_mut);
		auto ch = lookup(scid);
		if (!ch)
			return nullptr;
		auto dir = 0;
		if (ch->node[0] == from)
			dir = 0;
		else if (ch->node[1] == from)
			dir = 1;
		else
			return nullptr;
		auto chlock = std::unique_lock<std::mutex>(ch->mut);
		return edge(*ch, dir);
	}

	bool has_channel(Ln::Scid scid) const {
		auto lock = std::shared_lock<std::shared_mutex>(index_mut);
		return channels.find(scid) != channels.end();
	}
	std::size_t num_channels() const {
		auto lock = std::shared_lock<std::shared_mutex>(index_mut);
		return channels.size();
	}
};

ChannelGraph::ChannelGraph() : pimpl(Util::make_unique<Impl>()) { }
ChannelGraph::ChannelGraph(ChannelGraph&&) =default;
ChannelGraph::~ChannelGraph() =default;

bool ChannelGraph::add_channel( Ln::Scid channel
			      , Ln::NodeId const& node_1
			      , Ln::NodeId const& node_2
			      ) {
	return pimpl->add_channel(channel, node_1, node_2);
}
bool ChannelGraph::remove_channel(Ln::Scid channel) {
	return pimpl->remove_channel(channel);
}
bool ChannelGraph::apply_update(Ln::ChannelUpdate const& update) {
	return pimpl->apply_update(update);
}
std::vector<ChannelEdge>
ChannelGraph::edges_from(Ln::NodeId const& node) const {
	return pimpl->edges_from(node);
}
std::vector<ChannelEdge>
ChannelGraph::edges_to(Ln::NodeId const& node) const {
	return pimpl->edges_to(node);
}
std::unique_ptr<ChannelEdge>
ChannelGraph::find_edge(Ln::Scid channel, Ln::NodeId const& from) const {
	return pimpl->find_edge(channel, from);
}
bool ChannelGraph::has_channel(Ln::Scid channel) const {
	return pimpl->has_channel(channel);
}
std::size_t ChannelGraph::num_channels() const {
	return pimpl->num_channels();
}

}
