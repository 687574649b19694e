#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Json/Out.hpp"
#include"Router/Mod/Logger.hpp"
#include"Router/Msg/Log.hpp"
#include"Router/concurrent.hpp"
#include"S/Bus.hpp"

namespace Router { namespace Mod {

Logger::Logger( S::Bus& bus
	      , std::ostream& out_
	      , Router::LogLevel min_level_
	      ) : out(out_), min_level(min_level_) {
	bus.subscribe<Router::Msg::Log>([this](Router::Msg::Log const& l) {
		if (l.level < min_level)
			return Ev::lift();

		auto start = outs.empty();
		outs.push(Json::Out()
			.start_object()
				.field("level", log_level_name(l.level))
				.field("message", l.message)
			.end_object()
			.output()
		);

		if (!start)
			return Ev::lift();
		return Router::concurrent(loop());
	});
}

Ev::Io<void> Logger::loop() {
	return Ev::yield().then([this]() {
		if (outs.empty())
			return Ev::lift();
		out << outs.front() << std::endl;
		outs.pop();
		return loop();
	});
}

}}
