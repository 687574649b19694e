#ifndef ROUTER_PAYMENTSTATEMACHINE_HPP
#define ROUTER_PAYMENTSTATEMACHINE_HPP

#include<string>

namespace Router {

enum class PaymentState
{ Initiated
, RouteSelected
, Attempting
, Succeeded
, RetryableFailure
, TerminalFailure
, TimedOut
};
/* "INITIATED", "ROUTE_SELECTED", ...  */
std::string payment_state_name(PaymentState);

enum class PaymentEvent
{ RouteFound
, NoRoute
, Dispatched
, AttemptSucceeded
, AttemptFailedRetryable
, AttemptFailedTerminal
, BudgetExhausted
, DeadlineExpired
, Abort
};
std::string payment_event_name(PaymentEvent);

/** class Router::PaymentStateMachine
 *
 * @brief the states of one payment's attempt loop,
 * moved only along a fixed transition table.
 *
 * @desc Succeeded, TerminalFailure and TimedOut are
 * terminal.
 * `fire` throws Router::InternalError for an event
 * the table has no transition for.
 */
class PaymentStateMachine {
private:
	PaymentState state_;

public:
	PaymentStateMachine() : state_(PaymentState::Initiated) { }

	PaymentState state() const { return state_; }
	bool terminal() const;

	/* Returns the new state.  */
	PaymentState fire(PaymentEvent);

	/* Whether the table has a transition, without
	 * taking it.  */
	static bool can_fire(PaymentState, PaymentEvent);
	static bool is_terminal(PaymentState);
};

}

#endif /* !defined(ROUTER_PAYMENTSTATEMACHINE_HPP) */
