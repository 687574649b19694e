#ifndef ROUTER_LOG_HPP
#define ROUTER_LOG_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Router {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* "trace", "debug", ...  */
std::string log_level_name(LogLevel);
/* Returns false if the name is not a log level.  */
bool log_level_from_name(LogLevel&, std::string const&);

/** Router::log
 *
 * @brief formats a message printf-style and raises
 * it as a Router::Msg::Log on the bus.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* ROUTER_LOG_HPP */
