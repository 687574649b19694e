#ifndef ROUTER_MSG_LOG_HPP
#define ROUTER_MSG_LOG_HPP

#include"Router/log.hpp"
#include<string>

namespace Router { namespace Msg {

/** struct Router::Msg::Log
 *
 * @brief one log entry, raised by Router::log.
 */
struct Log {
	Router::LogLevel level;
	std::string message;
};

}}

#endif /* !defined(ROUTER_MSG_LOG_HPP) */
