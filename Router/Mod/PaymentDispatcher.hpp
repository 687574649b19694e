#ifndef ROUTER_MOD_PAYMENTDISPATCHER_HPP
#define ROUTER_MOD_PAYMENTDISPATCHER_HPP

#include"Ln/Failure.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Preimage.hpp"
#include"Router/PaymentIntent.hpp"
#include"Router/PaymentResult.hpp"
#include"Util/Either.hpp"
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ln { struct Route; }
namespace Router { class AttemptSenderIF; }
namespace Router { class ChannelGraph; }
namespace Router { class Config; }
namespace Router { class FundsAuthorizerIF; }
namespace Router { namespace Mod { class Waiter; }}
namespace S { class Bus; }
namespace Sha256 { class Hash; }

namespace Router { namespace Mod {

/** class Router::Mod::PaymentDispatcher
 *
 * @brief runs the attempt loop of each payment.
 *
 * @desc Each `send_payment` call is its own loop:
 * find a route in the shared graph minus what this
 * payment has pruned, commit the funds, send, and
 * interpret the failure until the payment succeeds,
 * fails for good, runs out of attempts, or reaches
 * its deadline.
 * Policy updates carried by failures go into the
 * shared graph; pruned channels and nodes stay
 * private to the payment.
 *
 * At most one loop runs per payment hash; a second
 * `send_payment` for a hash in flight is rejected
 * with ErrorKind::AlreadyInFlight.
 *
 * Every payment ends with a documented result and
 * a Router::Msg::PaymentResult; each attempt raises
 * a Router::Msg::AttemptResult.
 */
class PaymentDispatcher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	PaymentDispatcher() =delete;
	PaymentDispatcher(PaymentDispatcher const&) =delete;

	PaymentDispatcher( S::Bus& bus
			 , Router::ChannelGraph& graph
			 , Router::Config const& config
			 , Router::Mod::Waiter& waiter
			 , Router::AttemptSenderIF& sender
			 , Router::FundsAuthorizerIF& funds
			 , Ln::NodeId self
			 );
	~PaymentDispatcher();

	/** Router::Mod::PaymentDispatcher::send_payment
	 *
	 * @brief makes the payment, completing once it
	 * has reached a terminal state.
	 *
	 * @desc Failures are reported in the result and
	 * never as exceptions, except Router::Shutdown.
	 */
	Ev::Io<Router::PaymentResult>
	send_payment(Router::PaymentIntent intent);

	/** Router::Mod::PaymentDispatcher::send_to_route
	 *
	 * @brief sends one attempt over the given route,
	 * with no route search and no retries.
	 *
	 * @desc Throws Router::ClientConstraintError for
	 * an empty route, a non-positive timeout, or
	 * insufficient funds, and Waiter::TimedOut if the
	 * attempt has not resolved within `timeout`
	 * seconds (the attempt is then cancelled).
	 */
	Ev::Io<Util::Either<Ln::Failure, Ln::Preimage>>
	send_to_route( Sha256::Hash const& payment_hash
		     , Ln::Route const& route
		     , double timeout
		     );

	/* Whether a `send_payment` loop holds the hash.  */
	bool in_flight(Sha256::Hash const& payment_hash) const;
};

}}

#endif /* !defined(ROUTER_MOD_PAYMENTDISPATCHER_HPP) */
