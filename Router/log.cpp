#include"Ev/Io.hpp"
#include"Router/Msg/Log.hpp"
#include"Router/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Router {

std::string log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}
bool log_level_from_name(LogLevel& l, std::string const& name) {
	for (auto c : {Trace, Debug, Info, Warn, Error}) {
		if (log_level_name(c) == name) {
			l = c;
			return true;
		}
	}
	return false;
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Router::Msg::Log{l, std::move(msg)});
}

}
