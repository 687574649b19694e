#ifndef ROUTER_MAIN_HPP
#define ROUTER_MAIN_HPP

#include<memory>
#include<ostream>

namespace Ev { template<typename a> class Io; }
namespace Ln { class NodeId; }
namespace Router { class AttemptSenderIF; }
namespace Router { class ChannelGraph; }
namespace Router { class Config; }
namespace Router { class FundsAuthorizerIF; }
namespace Router { namespace Mod { class PaymentDispatcher; }}
namespace Router { namespace Mod { class RouterService; }}
namespace S { class Bus; }

namespace Router {

/** class Router::Main
 *
 * @brief the router assembled: a bus, the shared
 * channel graph, and every module, paying from the
 * given node through the given collaborators.
 *
 * @desc The graph feed raises its messages on `bus()`;
 * RPCs go to `service()`.
 * Log entries at or above the configured level are
 * written to `log_out`.
 * The collaborators must outlive this object.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() =delete;
	Main( Router::Config config
	    , std::ostream& log_out
	    , Router::AttemptSenderIF& sender
	    , Router::FundsAuthorizerIF& funds
	    , Ln::NodeId const& self
	    );
	Main(Main&&);
	~Main();

	S::Bus& bus();
	Router::Config const& config() const;
	Router::ChannelGraph& graph();
	Router::Mod::PaymentDispatcher& dispatcher();
	Router::Mod::RouterService& service();

	/* Broadcasts Router::Shutdown; pending timers
	 * fail with it.  */
	Ev::Io<void> shutdown();
};

}

#endif /* !defined(ROUTER_MAIN_HPP) */
