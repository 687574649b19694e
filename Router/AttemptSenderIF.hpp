#ifndef ROUTER_ATTEMPTSENDERIF_HPP
#define ROUTER_ATTEMPTSENDERIF_HPP

#include"Ev/Io.hpp"
#include"Ln/Failure.hpp"
#include"Ln/Preimage.hpp"
#include"Util/Either.hpp"

namespace Ln { struct Route; }
namespace Sha256 { class Hash; }

namespace Router {

/** class Router::AttemptSenderIF
 *
 * @brief interface to the onion and transport layer
 * that carries one attempt over a route.
 */
class AttemptSenderIF {
public:
	virtual ~AttemptSenderIF() { }

	/** Router::AttemptSenderIF::send
	 *
	 * @brief sends the HTLCs for the route and
	 * completes once the attempt has resolved, with
	 * either the failure reported by the network or
	 * the preimage.
	 *
	 * @desc The action may take arbitrarily long;
	 * callers bound it with a timer and then call
	 * `cancel`.
	 */
	virtual
	Ev::Io<Util::Either<Ln::Failure, Ln::Preimage>>
	send( Sha256::Hash const& payment_hash
	    , Ln::Route const& route
	    ) =0;

	/* Abandons the outstanding attempt for the hash,
	 * if any.  */
	virtual
	Ev::Io<void> cancel(Sha256::Hash const& payment_hash) =0;
};

}

#endif /* !defined(ROUTER_ATTEMPTSENDERIF_HPP) */
