#ifndef ROUTER_MOD_LOGGER_HPP
#define ROUTER_MOD_LOGGER_HPP

#include"Router/log.hpp"
#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Router { namespace Mod {

/** class Router::Mod::Logger
 *
 * @brief module that writes Router::Msg::Log
 * entries at or above a level to a stream, one
 * JSON object per line.
 */
class Logger {
private:
	std::ostream& out;
	Router::LogLevel min_level;
	std::queue<std::string> outs;

	Ev::Io<void> loop();
public:
	Logger( S::Bus& bus
	      , std::ostream& out_
	      , Router::LogLevel min_level_
	      );
};

}}

#endif /* !defined(ROUTER_MOD_LOGGER_HPP) */
