#include"Ev/Io.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Mod/GraphUpdater.hpp"
#include"Router/Msg/ChannelAnnouncement.hpp"
#include"Router/Msg/ChannelClosed.hpp"
#include"Router/Msg/ChannelUpdate.hpp"
#include"Router/log.hpp"
#include"S/Bus.hpp"

namespace Router { namespace Mod {

void GraphUpdater::start() {
	bus.subscribe<Msg::ChannelAnnouncement
		     >([this](Msg::ChannelAnnouncement const& m) {
		if (!graph.add_channel(m.channel, m.node_1, m.node_2))
			return Router::log( bus, Debug
					  , "GraphUpdater: Ignored announcement "
					    "of %s."
					  , std::string(m.channel).c_str()
					  );
		return Router::log( bus, Trace
				  , "GraphUpdater: Added %s between %s and %s."
				  , std::string(m.channel).c_str()
				  , std::string(m.node_1).c_str()
				  , std::string(m.node_2).c_str()
				  );
	});
	bus.subscribe<Msg::ChannelUpdate
		     >([this](Msg::ChannelUpdate const& m) {
		auto const& u = m.update;
		if (!graph.apply_update(u))
			return Router::log( bus, Trace
					  , "GraphUpdater: Discarded stale or "
					    "unknown update %s/%d at %u."
					  , std::string(u.chan_id).c_str()
					  , u.direction()
					  , (unsigned) u.timestamp
					  );
		return Router::log( bus, Trace
				  , "GraphUpdater: Applied update %s/%d at %u."
				  , std::string(u.chan_id).c_str()
				  , u.direction()
				  , (unsigned) u.timestamp
				  );
	});
	bus.subscribe<Msg::ChannelClosed
		     >([this](Msg::ChannelClosed const& m) {
		if (!graph.remove_channel(m.channel))
			return Ev::lift();
		return Router::log( bus, Debug
				  , "GraphUpdater: Removed %s."
				  , std::string(m.channel).c_str()
				  );
	});
}

}}
