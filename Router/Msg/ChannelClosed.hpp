#ifndef ROUTER_MSG_CHANNELCLOSED_HPP
#define ROUTER_MSG_CHANNELCLOSED_HPP

#include"Ln/Scid.hpp"

namespace Router { namespace Msg {

/* Raised by the graph feed when a channel is gone.  */
struct ChannelClosed {
	Ln::Scid channel;
};

}}

#endif /* !defined(ROUTER_MSG_CHANNELCLOSED_HPP) */
