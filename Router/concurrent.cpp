#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Router/Shutdown.hpp"
#include"Router/concurrent.hpp"

namespace Router {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(std::move(io).catching<Router::Shutdown>([](Router::Shutdown const& _) {
		return Ev::lift();
	}));
}

}
