#ifndef ROUTER_MSG_ATTEMPTRESULT_HPP
#define ROUTER_MSG_ATTEMPTRESULT_HPP

#include"Ln/Failure.hpp"
#include"Ln/Route.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Router { namespace Msg {

/** struct Router::Msg::AttemptResult
 *
 * @brief raised after every attempt of a payment,
 * including the single attempt of a send to route.
 *
 * @desc `attempt` counts from 1.
 * `decision` is the interpretation of a failure, and
 * is empty on success and for sends to route.
 */
struct AttemptResult {
	Sha256::Hash payment_hash;
	std::uint32_t attempt;
	Ln::Route route;
	bool success;
	Ln::Failure failure;
	std::string decision;
};

}}

#endif /* !defined(ROUTER_MSG_ATTEMPTRESULT_HPP) */
