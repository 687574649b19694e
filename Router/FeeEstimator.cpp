#include"Router/FeeEstimator.hpp"

namespace Router {

FeeEstimator::Estimate
FeeEstimator::estimate( Ln::NodeId const& destination
		      , Ln::Amount amount
		      ) const {
	auto q = RouteQuery();
	q.source = self;
	q.destination = destination;
	q.amount = amount;
	auto route = finder.find_route(q);

	auto rv = Estimate();
	rv.routing_fee = route.total_fees();
	rv.time_lock_delay = route.total_cltv();
	return rv;
}

}
