#ifndef ROUTER_MSG_CHANNELANNOUNCEMENT_HPP
#define ROUTER_MSG_CHANNELANNOUNCEMENT_HPP

#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"

namespace Router { namespace Msg {

/** struct Router::Msg::ChannelAnnouncement
 *
 * @brief raised by the graph feed when a channel
 * between two nodes becomes known.
 */
struct ChannelAnnouncement {
	Ln::Scid channel;
	Ln::NodeId node_1;
	Ln::NodeId node_2;
};

}}

#endif /* !defined(ROUTER_MSG_CHANNELANNOUNCEMENT_HPP) */
