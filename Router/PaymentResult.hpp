#ifndef ROUTER_PAYMENTRESULT_HPP
#define ROUTER_PAYMENTRESULT_HPP

#include"Ln/Preimage.hpp"
#include"Ln/Route.hpp"
#include"Router/Error.hpp"
#include"Router/PaymentStateMachine.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Router {

/** struct Router::PaymentResult
 *
 * @brief how a payment ended.
 *
 * @desc On success `preimage` and `route` (the
 * route that succeeded) are set, and `error` is
 * ErrorKind::None.
 * Otherwise `error` and `message` say why.
 */
struct PaymentResult {
	Sha256::Hash payment_hash;
	ErrorKind error = ErrorKind::None;
	std::string message;
	Ln::Preimage preimage;
	Ln::Route route;
	std::uint32_t attempts = 0;
	PaymentState final_state = PaymentState::Initiated;

	bool succeeded() const { return error == ErrorKind::None; }
};

}

#endif /* !defined(ROUTER_PAYMENTRESULT_HPP) */
