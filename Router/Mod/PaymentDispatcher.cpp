#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/yield.hpp"
#include"Ln/Route.hpp"
#include"Router/AttemptSenderIF.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Config.hpp"
#include"Router/Error.hpp"
#include"Router/FailureInterpreter.hpp"
#include"Router/FundsAuthorizerIF.hpp"
#include"Router/Mod/PaymentDispatcher.hpp"
#include"Router/Mod/Waiter.hpp"
#include"Router/Msg/AttemptResult.hpp"
#include"Router/Msg/PaymentResult.hpp"
#include"Router/PaymentLocks.hpp"
#include"Router/PaymentStateMachine.hpp"
#include"Router/RouteFinder.hpp"
#include"Router/Shutdown.hpp"
#include"Router/log.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Util/stringify.hpp"
#include<set>

namespace Router { namespace Mod {

class PaymentDispatcher::Impl {
private:
	typedef Util::Either<Ln::Failure, Ln::Preimage> Outcome;

	S::Bus& bus;
	Router::ChannelGraph& graph;
	Router::Config const& config;
	Router::Mod::Waiter& waiter;
	Router::AttemptSenderIF& sender;
	Router::FundsAuthorizerIF& funds;
	Ln::NodeId self;

	Router::RouteFinder finder;
	Router::FailureInterpreter interpreter;

public:
	Router::PaymentLocks locks;

private:
	/* State of one send_payment loop.  */
	struct Run {
		Router::PaymentIntent intent;
		Router::PaymentStateMachine fsm;
		Router::PaymentLocks::Lock lock;
		double deadline;

		/* Pruned for this payment only.  */
		std::set<Ln::Scid> excluded_channels;
		std::set<Ln::NodeId> excluded_nodes;
		/* Channels whose update from a failure was
		 * already applied during this payment.  */
		std::set<Ln::Scid> updated_channels;

		std::uint32_t attempts;
		/* Set once the deadline has passed; anything
		 * the loop does afterwards is cleanup.  */
		bool expired;
		/* An AttemptSender call is outstanding.  */
		bool in_attempt;
		/* Funds are authorized for the current
		 * attempt.  */
		bool committed;
		Ln::Route route;
		std::string last_failure;

		Router::PaymentResult result;
	};

	void finish_with( Run& run
			, ErrorKind kind
			, std::string message
			) {
		run.result.error = kind;
		run.result.message = std::move(message);
	}

	Ev::Io<void> attempt_loop(std::shared_ptr<Run> run) {
		return Ev::yield().then([this, run]() {
			if (run->expired)
				return Ev::lift();
			if (Ev::now() >= run->deadline)
				throw Waiter::TimedOut();

			if (run->attempts >= config.max_attempts()) {
				run->fsm.fire(PaymentEvent::BudgetExhausted);
				finish_with( *run, ErrorKind::RemoteFailure
					   , Util::stringify(run->attempts)
					   + " attempts failed, last: "
					   + run->last_failure
					   );
				return Ev::lift();
			}

			auto route = Ln::Route();
			try {
				route = find_route(*run);
			} catch (NoRouteError const& e) {
				run->fsm.fire(PaymentEvent::NoRoute);
				auto msg = std::string(e.what());
				if (!run->last_failure.empty())
					msg += ", last failure: " + run->last_failure;
				finish_with(*run, ErrorKind::NoRoute, std::move(msg));
				return Ev::lift();
			}
			run->fsm.fire(PaymentEvent::RouteFound);
			run->route = route;
			++run->attempts;

			return funds.authorize( run->intent.payment_hash
					      , route.total_amount()
					      ).then([this, run](bool ok) {
				return dispatch(run, ok);
			});
		});
	}

	Ln::Route find_route(Run const& run) {
		auto const& intent = run.intent;
		auto q = Router::RouteQuery();
		q.source = self;
		q.destination = intent.destination;
		q.amount = intent.amount;
		q.fee_budget = intent.fee_limit;
		if (intent.cltv_limit != 0)
			q.cltv_budget = intent.cltv_limit - intent.final_cltv;
		q.excluded_channels = run.excluded_channels;
		q.excluded_nodes = run.excluded_nodes;
		q.required_first_hop = intent.first_hop;

		auto route = finder.find_route(q);
		/* The destination's own delta rides on the
		 * last hop.  */
		route.hops.back().cltv_delta += intent.final_cltv;
		return route;
	}

	Ev::Io<void> dispatch(std::shared_ptr<Run> run, bool ok) {
		auto const& hash = run->intent.payment_hash;
		auto amount = run->route.total_amount();
		if (run->expired) {
			if (!ok)
				return Ev::lift();
			return funds.release(hash, amount);
		}
		if (!ok) {
			run->fsm.fire(PaymentEvent::Abort);
			finish_with( *run, ErrorKind::ClientConstraint
				   , "insufficient funds for "
				   + std::string(amount)
				   );
			return Ev::lift();
		}
		run->committed = true;
		run->fsm.fire(PaymentEvent::Dispatched);
		run->in_attempt = true;
		auto route = run->route;
		return Router::log( bus, Debug
				  , "PaymentDispatcher: %s attempt %u: %s"
				  , std::string(hash).c_str()
				  , (unsigned) run->attempts
				  , Util::stringify(route).c_str()
				  ).then([this, run, route]() {
			return sender.send(run->intent.payment_hash, route);
		}).then([this, run, route](Outcome outcome) {
			run->in_attempt = false;
			return on_outcome(run, route, std::move(outcome));
		});
	}

	Ev::Io<void> on_outcome( std::shared_ptr<Run> run
			       , Ln::Route route
			       , Outcome outcome
			       ) {
		auto const& hash = run->intent.payment_hash;
		auto amount = route.total_amount();

		if (run->expired)
			return on_late_outcome(run, std::move(route), outcome);

		if (outcome.is_right()) {
			auto preimage = outcome.right();
			if (preimage.sha256() != hash)
				throw InternalError(
					"preimage does not match payment hash"
				);
			run->committed = false;
			run->fsm.fire(PaymentEvent::AttemptSucceeded);
			run->result.preimage = preimage;
			run->result.route = route;
			finish_with(*run, ErrorKind::None, "");
			return funds.settle(hash, amount)
			     + raise_attempt(run, route, true, Ln::Failure(), "")
			     ;
		}

		auto failure = outcome.left();
		run->committed = false;
		return funds.release(hash, amount).then([ this, run
							, route, failure
							]() {
			auto decision = interpreter.interpret(failure, route);
			return raise_attempt( run, route, false, failure
					    , to_string(decision)
					    ).then([this, run, failure, decision]() {
				return apply(run, failure, decision);
			});
		});
	}

	Ev::Io<void> on_late_outcome( std::shared_ptr<Run> run
				    , Ln::Route route
				    , Outcome const& outcome
				    ) {
		auto const& hash = run->intent.payment_hash;
		auto amount = route.total_amount();
		run->committed = false;
		if (outcome.is_left())
			return funds.release(hash, amount)
			     + Router::log( bus, Info
					  , "PaymentDispatcher: %s: attempt %u "
					    "failed after the deadline: %s"
					  , std::string(hash).c_str()
					  , (unsigned) run->attempts
					  , outcome.left().code_name().c_str()
					  )
			     ;
		return funds.settle(hash, amount)
		     + Router::log( bus, Warn
				  , "PaymentDispatcher: %s: attempt %u "
				    "succeeded after the deadline, "
				    "reported as timed out."
				  , std::string(hash).c_str()
				  , (unsigned) run->attempts
				  )
		     ;
	}

	Ev::Io<void> raise_attempt( std::shared_ptr<Run> run
				  , Ln::Route route
				  , bool success
				  , Ln::Failure failure
				  , std::string decision
				  ) {
		return bus.raise(Msg::AttemptResult{
			run->intent.payment_hash, run->attempts,
			std::move(route), success, std::move(failure),
			std::move(decision)
		});
	}

	Ev::Io<void> apply( std::shared_ptr<Run> run
			  , Ln::Failure const& failure
			  , Router::Decision const& d
			  ) {
		auto const& hash = run->intent.payment_hash;
		run->last_failure = failure.code_name()
				  + " from "
				  + std::string(failure.failure_source_pubkey)
				  ;

		if (d.kind == Decision::Abort) {
			run->fsm.fire(PaymentEvent::AttemptFailedTerminal);
			finish_with( *run, ErrorKind::RemoteFailure
				   , run->last_failure
				   );
			return Ev::lift();
		}

		auto act = std::string();
		switch (d.kind) {
		case Decision::PruneEdge:
			run->excluded_channels.insert(d.channel);
			act = "pruned " + std::string(d.channel);
			break;
		case Decision::PruneNode:
			run->excluded_nodes.insert(d.node);
			act = "pruned " + std::string(d.node);
			break;
		case Decision::ApplyUpdateAndRetry:
			/* An update that changes nothing would have
			 * the next attempt fail the same way.  */
			if ( run->updated_channels.count(d.channel) == 0
			  && graph.apply_update(*d.update)
			   ) {
				run->updated_channels.insert(d.channel);
				act = "updated " + std::string(d.channel);
			} else {
				run->excluded_channels.insert(d.channel);
				act = "pruned " + std::string(d.channel);
			}
			break;
		case Decision::Abort:
			break;
		}
		run->fsm.fire(PaymentEvent::AttemptFailedRetryable);
		return Router::log( bus, Debug
				  , "PaymentDispatcher: %s attempt %u: %s, %s."
				  , std::string(hash).c_str()
				  , (unsigned) run->attempts
				  , run->last_failure.c_str()
				  , act.c_str()
				  ).then([this, run]() {
			return attempt_loop(run);
		});
	}

	/* Deadline passed while the loop was running.  */
	Ev::Io<void> on_timeout(std::shared_ptr<Run> run) {
		auto const& hash = run->intent.payment_hash;
		run->expired = true;
		if (PaymentStateMachine::can_fire( run->fsm.state()
						 , PaymentEvent::DeadlineExpired
						 ))
			run->fsm.fire(PaymentEvent::DeadlineExpired);
		finish_with( *run, ErrorKind::Timeout
			   , "deadline of "
			   + Util::stringify(run->intent.timeout_seconds)
			   + "s exceeded after "
			   + Util::stringify(run->attempts)
			   + " attempt(s)"
			   );
		/* An outstanding attempt keeps its funds until
		 * it resolves, see on_late_outcome.  */
		if (run->in_attempt)
			return sender.cancel(hash);
		if (run->committed) {
			run->committed = false;
			return funds.release(hash, run->route.total_amount());
		}
		return Ev::lift();
	}

	Ev::Io<void> on_internal_error( std::shared_ptr<Run> run
				      , std::exception const& e
				      ) {
		auto const& hash = run->intent.payment_hash;
		if (PaymentStateMachine::can_fire( run->fsm.state()
						 , PaymentEvent::Abort
						 ))
			run->fsm.fire(PaymentEvent::Abort);
		finish_with(*run, ErrorKind::Internal, e.what());
		auto act = Router::log( bus, Error
				      , "PaymentDispatcher: %s: %s"
				      , std::string(hash).c_str()
				      , e.what()
				      );
		if (run->committed) {
			run->committed = false;
			act += funds.release(hash, run->route.total_amount());
		}
		return act;
	}

	Ev::Io<Router::PaymentResult> finish(std::shared_ptr<Run> run) {
		run->lock.release();
		auto& r = run->result;
		r.payment_hash = run->intent.payment_hash;
		r.attempts = run->attempts;
		r.final_state = run->fsm.state();
		auto result = r;
		auto level = result.succeeded() ? Info : Warn;
		return Router::log( bus, level
				  , "PaymentDispatcher: %s: %s after %u "
				    "attempt(s)%s%s"
				  , std::string(result.payment_hash).c_str()
				  , payment_state_name(result.final_state)
					.c_str()
				  , (unsigned) result.attempts
				  , result.succeeded() ? "" : ": "
				  , result.succeeded() ? "" : Router::error_kind_name(result.error).c_str()
				  ).then([this, result]() {
			return bus.raise(Msg::PaymentResult{result});
		}).then([result]() {
			return Ev::lift(result);
		});
	}

	/* Returns the empty string if the intent is
	 * usable.  */
	std::string validate(Router::PaymentIntent const& i) const {
		if (!i.payment_hash)
			return "payment hash required";
		if (!i.destination)
			return "destination required";
		if (i.destination == self)
			return "cannot pay self";
		if (i.amount == Ln::Amount())
			return "amount must be positive";
		if (!(i.timeout_seconds > 0))
			return "timeout must be positive";
		if (i.final_cltv == 0)
			return "final cltv delta must be positive";
		if (i.cltv_limit != 0 && i.cltv_limit < i.final_cltv)
			return "cltv limit " + Util::stringify(i.cltv_limit)
			     + " below final cltv delta "
			     + Util::stringify(i.final_cltv)
			     ;
		return "";
	}

public:
	Impl( S::Bus& bus_
	    , Router::ChannelGraph& graph_
	    , Router::Config const& config_
	    , Router::Mod::Waiter& waiter_
	    , Router::AttemptSenderIF& sender_
	    , Router::FundsAuthorizerIF& funds_
	    , Ln::NodeId self_
	    ) : bus(bus_)
	      , graph(graph_)
	      , config(config_)
	      , waiter(waiter_)
	      , sender(sender_)
	      , funds(funds_)
	      , self(std::move(self_))
	      , finder(graph_, config_)
	      , interpreter(self)
	      { }

	Ev::Io<Router::PaymentResult>
	send_payment(Router::PaymentIntent intent) {
		return Ev::lift().then([this, intent]() {
			auto run = std::make_shared<Run>();
			run->intent = intent;
			run->deadline = 0;
			run->attempts = 0;
			run->expired = false;
			run->in_attempt = false;
			run->committed = false;

			auto err = validate(intent);
			if (!err.empty()) {
				run->fsm.fire(PaymentEvent::Abort);
				finish_with( *run, ErrorKind::ClientConstraint
					   , std::move(err)
					   );
				return finish(run);
			}
			run->lock = locks.try_acquire(intent.payment_hash);
			if (!run->lock) {
				run->fsm.fire(PaymentEvent::Abort);
				finish_with( *run, ErrorKind::AlreadyInFlight
					   , "payment already in flight"
					   );
				return finish(run);
			}

			auto timeout = intent.timeout_seconds;
			run->deadline = Ev::now() + timeout;
			return Router::log( bus, Info
					  , "PaymentDispatcher: %s: paying %s "
					    "to %s within %gs."
					  , std::string(intent.payment_hash).c_str()
					  , std::string(intent.amount).c_str()
					  , std::string(intent.destination).c_str()
					  , timeout
					  ).then([this, run, timeout]() {
				return waiter.timed(timeout, attempt_loop(run));
			}).catching<Waiter::TimedOut>([this, run](Waiter::TimedOut const& _) {
				return on_timeout(run);
			}).catching<std::exception>([this, run](std::exception const& e) {
				return on_internal_error(run, e);
			}).catching<Router::Shutdown>([run](Router::Shutdown const& _) {
				run->lock.release();
				throw Router::Shutdown();
				return Ev::lift();
			}).then([this, run]() {
				return finish(run);
			});
		});
	}

	Ev::Io<Outcome>
	send_to_route( Sha256::Hash const& hash
		     , Ln::Route const& route
		     , double timeout
		     ) {
		return Ev::lift().then([this, hash, route, timeout]() {
			if (route.empty())
				throw ClientConstraintError("route is empty");
			if (!(timeout > 0))
				throw ClientConstraintError("timeout must be positive");
			return funds.authorize(hash, route.total_amount());
		}).then([this, hash, route, timeout](bool ok) {
			auto amount = route.total_amount();
			if (!ok)
				throw ClientConstraintError(
					"insufficient funds for "
					+ std::string(amount)
				);
			return Router::log( bus, Debug
					  , "PaymentDispatcher: %s send to route: %s"
					  , std::string(hash).c_str()
					  , Util::stringify(route).c_str()
					  ).then([this, hash, route, timeout]() {
				return waiter.timed(timeout, sender.send(hash, route));
			}).catching<Waiter::TimedOut>([ this, hash, amount
						      ](Waiter::TimedOut const& _) {
				auto cleanup = sender.cancel(hash)
					     + funds.release(hash, amount)
					     + Router::log( bus, Warn
							  , "PaymentDispatcher: %s "
							    "send to route timed out."
							  , std::string(hash).c_str()
							  )
					     ;
				return cleanup.then([]() -> Ev::Io<Outcome> {
					throw Waiter::TimedOut();
				});
			}).then([this, hash, route, amount](Outcome outcome) {
				auto act = outcome.is_right()
					 ? funds.settle(hash, amount)
					 : funds.release(hash, amount)
					 ;
				auto failure = outcome.is_left()
					     ? outcome.left()
					     : Ln::Failure()
					     ;
				act += bus.raise(Msg::AttemptResult{
					hash, 1, route, outcome.is_right(),
					std::move(failure), ""
				});
				return act.then([outcome]() {
					return Ev::lift(outcome);
				});
			});
		});
	}
};

PaymentDispatcher::PaymentDispatcher( S::Bus& bus
				    , Router::ChannelGraph& graph
				    , Router::Config const& config
				    , Router::Mod::Waiter& waiter
				    , Router::AttemptSenderIF& sender
				    , Router::FundsAuthorizerIF& funds
				    , Ln::NodeId self
				    ) : pimpl(Util::make_unique<Impl>( bus, graph
								     , config
								     , waiter
								     , sender
								     , funds
								     , std::move(self)
								     ))
				      { }
PaymentDispatcher::~PaymentDispatcher() =default;

Ev::Io<Router::PaymentResult>
PaymentDispatcher::send_payment(Router::PaymentIntent intent) {
	return pimpl->send_payment(std::move(intent));
}
Ev::Io<Util::Either<Ln::Failure, Ln::Preimage>>
PaymentDispatcher::send_to_route( Sha256::Hash const& payment_hash
				, Ln::Route const& route
				, double timeout
				) {
	return pimpl->send_to_route(payment_hash, route, timeout);
}
bool PaymentDispatcher::in_flight(Sha256::Hash const& payment_hash) const {
	return pimpl->locks.is_held(payment_hash);
}

}}
