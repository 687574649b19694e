#ifndef ROUTER_PAYMENTINTENT_HPP
#define ROUTER_PAYMENTINTENT_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>

namespace Router {

/** struct Router::PaymentIntent
 *
 * @brief a payment for the dispatcher to make.
 *
 * @desc `cltv_limit` bounds the sum of every hop
 * delta including `final_cltv`; 0 means no limit.
 * A null `first_hop` leaves the outgoing channel
 * free.
 */
struct PaymentIntent {
	Sha256::Hash payment_hash;
	Ln::NodeId destination;
	Ln::Amount amount;
	Ln::Amount fee_limit = Ln::Amount::max();
	std::uint32_t cltv_limit = 0;
	std::uint32_t final_cltv = 18;
	double timeout_seconds = 60;
	Ln::Scid first_hop;
};

}

#endif /* !defined(ROUTER_PAYMENTINTENT_HPP) */
