#ifndef ROUTER_MSG_PAYMENTRESULT_HPP
#define ROUTER_MSG_PAYMENTRESULT_HPP

#include"Router/PaymentResult.hpp"

namespace Router { namespace Msg {

/* Raised once when a payment reaches a terminal
 * state.  */
struct PaymentResult {
	Router::PaymentResult result;
};

}}

#endif /* !defined(ROUTER_MSG_PAYMENTRESULT_HPP) */
