#include"Router/Error.hpp"
#include"Router/PaymentStateMachine.hpp"
#include<cstddef>

namespace {

using Router::PaymentEvent;
using Router::PaymentState;

struct Transition {
	PaymentState from;
	PaymentEvent event;
	PaymentState to;
};

Transition const transitions[] =
{ {PaymentState::Initiated, PaymentEvent::RouteFound, PaymentState::RouteSelected}
, {PaymentState::Initiated, PaymentEvent::NoRoute, PaymentState::TerminalFailure}
, {PaymentState::Initiated, PaymentEvent::Abort, PaymentState::TerminalFailure}
, {PaymentState::Initiated, PaymentEvent::DeadlineExpired, PaymentState::TimedOut}

, {PaymentState::RouteSelected, PaymentEvent::Dispatched, PaymentState::Attempting}
, {PaymentState::RouteSelected, PaymentEvent::Abort, PaymentState::TerminalFailure}
, {PaymentState::RouteSelected, PaymentEvent::DeadlineExpired, PaymentState::TimedOut}

, {PaymentState::Attempting, PaymentEvent::AttemptSucceeded, PaymentState::Succeeded}
, {PaymentState::Attempting, PaymentEvent::AttemptFailedRetryable, PaymentState::RetryableFailure}
, {PaymentState::Attempting, PaymentEvent::AttemptFailedTerminal, PaymentState::TerminalFailure}
, {PaymentState::Attempting, PaymentEvent::Abort, PaymentState::TerminalFailure}
, {PaymentState::Attempting, PaymentEvent::DeadlineExpired, PaymentState::TimedOut}

, {PaymentState::RetryableFailure, PaymentEvent::RouteFound, PaymentState::RouteSelected}
, {PaymentState::RetryableFailure, PaymentEvent::NoRoute, PaymentState::TerminalFailure}
, {PaymentState::RetryableFailure, PaymentEvent::BudgetExhausted, PaymentState::TerminalFailure}
, {PaymentState::RetryableFailure, PaymentEvent::Abort, PaymentState::TerminalFailure}
, {PaymentState::RetryableFailure, PaymentEvent::DeadlineExpired, PaymentState::TimedOut}
};

Transition const* lookup(PaymentState from, PaymentEvent event) {
	for (auto const& t : transitions)
		if (t.from == from && t.event == event)
			return &t;
	return nullptr;
}

}

namespace Router {

std::string payment_state_name(PaymentState s) {
	switch (s) {
	case PaymentState::Initiated: return "INITIATED";
	case PaymentState::RouteSelected: return "ROUTE_SELECTED";
	case PaymentState::Attempting: return "ATTEMPTING";
	case PaymentState::Succeeded: return "SUCCEEDED";
	case PaymentState::RetryableFailure: return "RETRYABLE_FAILURE";
	case PaymentState::TerminalFailure: return "TERMINAL_FAILURE";
	case PaymentState::TimedOut: return "TIMED_OUT";
	}
	return "UNKNOWN";
}
std::string payment_event_name(PaymentEvent e) {
	switch (e) {
	case PaymentEvent::RouteFound: return "route_found";
	case PaymentEvent::NoRoute: return "no_route";
	case PaymentEvent::Dispatched: return "dispatched";
	case PaymentEvent::AttemptSucceeded: return "attempt_succeeded";
	case PaymentEvent::AttemptFailedRetryable: return "attempt_failed_retryable";
	case PaymentEvent::AttemptFailedTerminal: return "attempt_failed_terminal";
	case PaymentEvent::BudgetExhausted: return "budget_exhausted";
	case PaymentEvent::DeadlineExpired: return "deadline_expired";
	case PaymentEvent::Abort: return "abort";
	}
	return "unknown";
}

bool PaymentStateMachine::is_terminal(PaymentState s) {
	return s == PaymentState::Succeeded
	    || s == PaymentState::TerminalFailure
	    || s == PaymentState::TimedOut
	     ;
}
bool PaymentStateMachine::terminal() const {
	return is_terminal(state_);
}
bool PaymentStateMachine::can_fire(PaymentState s, PaymentEvent e) {
	return lookup(s, e) != nullptr;
}

PaymentState PaymentStateMachine::fire(PaymentEvent e) {
	auto t = lookup(state_, e);
	if (!t)
		throw InternalError(
			"PaymentStateMachine: no transition from "
			+ payment_state_name(state_) + " on "
			+ payment_event_name(e)
		);
	state_ = t->to;
	return state_;
}

}
