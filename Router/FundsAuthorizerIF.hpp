#ifndef ROUTER_FUNDSAUTHORIZERIF_HPP
#define ROUTER_FUNDSAUTHORIZERIF_HPP

#include"Ev/Io.hpp"
#include"Ln/Amount.hpp"

namespace Sha256 { class Hash; }

namespace Router {

/** class Router::FundsAuthorizerIF
 *
 * @brief interface to the wallet and settlement
 * layer.
 *
 * @desc Each attempt commits its total amount with
 * `authorize` before it is sent; the commitment is
 * then either released (the attempt failed) or
 * settled (the payment succeeded).
 */
class FundsAuthorizerIF {
public:
	virtual ~FundsAuthorizerIF() { }

	/* Returns false if the funds are not available.  */
	virtual
	Ev::Io<bool> authorize( Sha256::Hash const& payment_hash
			      , Ln::Amount amount
			      ) =0;
	virtual
	Ev::Io<void> release( Sha256::Hash const& payment_hash
			    , Ln::Amount amount
			    ) =0;
	virtual
	Ev::Io<void> settle( Sha256::Hash const& payment_hash
			   , Ln::Amount amount
			   ) =0;
};

}

#endif /* !defined(ROUTER_FUNDSAUTHORIZERIF_HPP) */
