#ifndef ROUTER_MSG_CHANNELUPDATE_HPP
#define ROUTER_MSG_CHANNELUPDATE_HPP

#include"Ln/ChannelUpdate.hpp"

namespace Router { namespace Msg {

/** struct Router::Msg::ChannelUpdate
 *
 * @brief raised by the graph feed for each policy
 * update it receives.
 */
struct ChannelUpdate {
	Ln::ChannelUpdate update;
};

}}

#endif /* !defined(ROUTER_MSG_CHANNELUPDATE_HPP) */
