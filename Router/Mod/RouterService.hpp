#ifndef ROUTER_MOD_ROUTERSERVICE_HPP
#define ROUTER_MOD_ROUTERSERVICE_HPP

#include"Router/Rpc.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Router { class Config; }
namespace Router { class FeeEstimator; }
namespace Router { struct PaymentIntent; }
namespace Router { namespace Mod { class PaymentDispatcher; }}
namespace S { class Bus; }

namespace Router { namespace Mod {

/** class Router::Mod::RouterService
 *
 * @brief implements the router's unary RPCs on top
 * of the dispatcher and the fee estimator.
 *
 * @desc Every call completes with a response; errors
 * are reported in the response, never thrown.
 */
class RouterService {
private:
	S::Bus& bus;
	Router::Config const& config;
	Router::Mod::PaymentDispatcher& dispatcher;
	Router::FeeEstimator const& estimator;

	/* Fills the intent from the request, or returns
	 * why the request is unusable.  */
	std::string make_intent( Router::PaymentIntent& intent
			       , Rpc::PaymentRequest const& req
			       ) const;

public:
	RouterService() =delete;
	RouterService(RouterService const&) =delete;

	RouterService( S::Bus& bus_
		     , Router::Config const& config_
		     , Router::Mod::PaymentDispatcher& dispatcher_
		     , Router::FeeEstimator const& estimator_
		     ) : bus(bus_)
		       , config(config_)
		       , dispatcher(dispatcher_)
		       , estimator(estimator_)
		       { }

	/** Router::Mod::RouterService::send_payment
	 *
	 * @brief pays a BOLT-11 payment request, trying
	 * routes until the payment succeeds, fails for
	 * good, or times out.
	 */
	Ev::Io<Rpc::PaymentResponse>
	send_payment(Rpc::PaymentRequest req);

	/* Fee and delay of the route a payment would take
	 * now, without paying.  */
	Ev::Io<Rpc::RouteFeeResponse>
	estimate_route_fee(Rpc::RouteFeeRequest req);

	/* One attempt over the caller's route.  */
	Ev::Io<Rpc::SendToRouteResponse>
	send_to_route(Rpc::SendToRouteRequest req);
};

}}

#endif /* !defined(ROUTER_MOD_ROUTERSERVICE_HPP) */
