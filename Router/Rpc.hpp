#ifndef ROUTER_RPC_HPP
#define ROUTER_RPC_HPP

#include"Ln/Failure.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Preimage.hpp"
#include"Ln/Route.hpp"
#include"Router/Error.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<memory>
#include<string>

/* Requests and responses of the router's unary RPCs.
 * Marshaling them to and from a wire format is the
 * transport's business.  */

namespace Router { namespace Rpc {

/** struct Router::Rpc::Status
 *
 * @brief outcome of a call; `ok()` iff `kind` is
 * ErrorKind::None.
 */
struct Status {
	Router::ErrorKind kind = Router::ErrorKind::None;
	std::string message;

	bool ok() const { return kind == Router::ErrorKind::None; }
	/* "<kind>: <message>", or empty if ok.  */
	std::string to_string() const;
};

struct PaymentRequest {
	/* BOLT-11 payment request.  */
	std::string pay_req;
	/* Absolute ceiling on the route's fees.  */
	std::int64_t fee_limit_sat = 0;
	/* Ceiling on the route's total CLTV, including
	 * the final delta; 0 means none.  */
	std::int32_t cltv_limit = 0;
	std::int32_t timeout_seconds = 0;
	/* Channel the payment must leave by; 0 means
	 * any.  */
	std::int64_t outgoing_channel_id = 0;
};
struct PaymentResponse {
	Sha256::Hash pay_hash;
	Ln::Preimage pre_image;
	/* Empty iff the payment succeeded.  */
	std::string payment_err;
};

struct RouteFeeRequest {
	Ln::NodeId dest;
	std::int64_t amt_sat = 0;
};
struct RouteFeeResponse {
	/* Lower bound.  */
	std::int64_t routing_fee_msat = 0;
	/* Excludes the destination's final delta.  */
	std::int64_t time_lock_delay = 0;
	Status status;
};

struct SendToRouteRequest {
	Sha256::Hash payment_hash;
	Ln::Route route;
};
/* On success `preimage` is set and `failure` is
 * null; if the network failed the attempt
 * `failure` is set; otherwise `status` says why
 * nothing was sent or no outcome arrived.  */
struct SendToRouteResponse {
	Ln::Preimage preimage;
	std::shared_ptr<Ln::Failure const> failure;
	Status status;
};

}}

#endif /* !defined(ROUTER_RPC_HPP) */
