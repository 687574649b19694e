#include"Ev/Io.hpp"
#include"Ln/NodeId.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Config.hpp"
#include"Router/FeeEstimator.hpp"
#include"Router/Main.hpp"
#include"Router/Mod/GraphUpdater.hpp"
#include"Router/Mod/Logger.hpp"
#include"Router/Mod/PaymentDispatcher.hpp"
#include"Router/Mod/RouterService.hpp"
#include"Router/Mod/Waiter.hpp"
#include"Router/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<vector>

namespace Router {

class Main::Impl {
private:
	/* Destroyed in reverse order of installation.  */
	std::vector<std::shared_ptr<void>> modules;

	template<typename M, typename... As>
	M& install(As&&... as) {
		auto ptr = std::make_shared<M>(std::forward<As>(as)...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return *ptr;
	}

public:
	/* Declared before the modules, which refer to
	 * them.  */
	S::Bus bus;
	Router::Config config;
	Router::ChannelGraph graph;
	std::unique_ptr<Router::FeeEstimator> estimator;

	Router::Mod::Waiter* waiter;
	Router::Mod::PaymentDispatcher* dispatcher;
	Router::Mod::RouterService* service;

	Impl( Router::Config config_
	    , std::ostream& log_out
	    , Router::AttemptSenderIF& sender
	    , Router::FundsAuthorizerIF& funds
	    , Ln::NodeId const& self
	    ) : config(std::move(config_)) {
		estimator = Util::make_unique<Router::FeeEstimator>(
			graph, config, self
		);
		install<Mod::Logger>(bus, log_out, config.log_level());
		waiter = &install<Mod::Waiter>(bus);
		install<Mod::GraphUpdater>(bus, graph);
		dispatcher = &install<Mod::PaymentDispatcher>( bus
							     , graph
							     , config
							     , *waiter
							     , sender
							     , funds
							     , self
							     );
		service = &install<Mod::RouterService>( bus
						      , config
						      , *dispatcher
						      , *estimator
						      );
	}
	~Impl() {
		while (!modules.empty())
			modules.pop_back();
	}
};

Main::Main( Router::Config config
	  , std::ostream& log_out
	  , Router::AttemptSenderIF& sender
	  , Router::FundsAuthorizerIF& funds
	  , Ln::NodeId const& self
	  ) : pimpl(Util::make_unique<Impl>( std::move(config)
					   , log_out
					   , sender
					   , funds
					   , self
					   ))
	    { }
Main::Main(Main&&) =default;
Main::~Main() =default;

S::Bus& Main::bus() { return pimpl->bus; }
Router::Config const& Main::config() const { return pimpl->config; }
Router::ChannelGraph& Main::graph() { return pimpl->graph; }
Router::Mod::PaymentDispatcher& Main::dispatcher() {
	return *pimpl->dispatcher;
}
Router::Mod::RouterService& Main::service() { return *pimpl->service; }

Ev::Io<void> Main::shutdown() {
	return pimpl->bus.raise(Router::Shutdown());
}

}
