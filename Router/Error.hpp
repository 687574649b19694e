#ifndef ROUTER_ERROR_HPP
#define ROUTER_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Router {

/** enum Router::ErrorKind
 *
 * @brief how a payment ended, as reported to the
 * caller.
 */
enum class ErrorKind
{ None
/* The request itself is unusable; no attempt made.  */
, ClientConstraint
/* No route satisfies the constraints.  */
, NoRoute
/* The network rejected the payment for good.  */
, RemoteFailure
/* The deadline expired.  */
, Timeout
/* Another payment with the same hash is running.  */
, AlreadyInFlight
/* Graph or state inconsistency.  */
, Internal
};

/* "client_constraint", "no_route", ...  */
std::string error_kind_name(ErrorKind);

/* The request violates a constraint of the caller's
 * own making: malformed or expired payment request,
 * non-positive timeout, unusable required channel,
 * insufficient funds.  */
struct ClientConstraintError
		: public Util::BacktraceException<std::invalid_argument> {
	explicit
	ClientConstraintError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

/* No route satisfies the fee, CLTV, HTLC limit, and
 * exclusion constraints.  */
struct NoRouteError : public Util::BacktraceException<std::runtime_error> {
	explicit
	NoRouteError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/* Inconsistency between the graph, a route, and the
 * payment state.  */
struct InternalError : public Util::BacktraceException<std::logic_error> {
	explicit
	InternalError(std::string const& msg)
		: Util::BacktraceException<std::logic_error>(msg) { }
};

/* Unknown configuration option or malformed value.  */
struct ConfigError : public Util::BacktraceException<std::invalid_argument> {
	explicit
	ConfigError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

}

#endif /* !defined(ROUTER_ERROR_HPP) */
