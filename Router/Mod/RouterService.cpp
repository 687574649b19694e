#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ln/Invoice.hpp"
#include"Router/Config.hpp"
#include"Router/Error.hpp"
#include"Router/FeeEstimator.hpp"
#include"Router/Mod/PaymentDispatcher.hpp"
#include"Router/Mod/RouterService.hpp"
#include"Router/Mod/Waiter.hpp"
#include"Router/PaymentIntent.hpp"
#include"Router/log.hpp"
#include"S/Bus.hpp"
#include"Util/stringify.hpp"
#include<cstdint>
#include<limits>

namespace {

auto const max_int64 = std::uint64_t(std::numeric_limits<std::int64_t>::max());

}

namespace Router { namespace Mod {

std::string
RouterService::make_intent( Router::PaymentIntent& intent
			  , Rpc::PaymentRequest const& req
			  ) const {
	if (req.fee_limit_sat < 0)
		return "fee limit must not be negative";
	if (req.cltv_limit < 0)
		return "cltv limit must not be negative";
	if (req.timeout_seconds <= 0)
		return "timeout must be positive";
	if (req.outgoing_channel_id < 0)
		return "invalid outgoing channel id";

	auto invoice = Ln::Invoice();
	try {
		invoice = Ln::Invoice(req.pay_req);
	} catch (Ln::InvoiceError const& e) {
		return std::string("invalid payment request: ") + e.what();
	}
	if (invoice.expired(Ev::now()))
		return "payment request expired";
	if (!invoice.has_amount)
		return "payment request has no amount";

	intent.payment_hash = invoice.payment_hash;
	intent.destination = invoice.payee;
	intent.amount = invoice.amount;
	intent.fee_limit = Ln::Amount::sat(std::uint64_t(req.fee_limit_sat));
	intent.cltv_limit = std::uint32_t(req.cltv_limit);
	intent.final_cltv = invoice.has_min_final_cltv_expiry
			  ? invoice.min_final_cltv_expiry
			  : config.default_final_cltv()
			  ;
	intent.timeout_seconds = double(req.timeout_seconds);
	intent.first_hop = Ln::Scid::from_u64(
		std::uint64_t(req.outgoing_channel_id)
	);
	return "";
}

Ev::Io<Rpc::PaymentResponse>
RouterService::send_payment(Rpc::PaymentRequest req) {
	return Ev::lift().then([this, req]() {
		auto intent = Router::PaymentIntent();
		auto err = make_intent(intent, req);
		if (!err.empty()) {
			auto status = Rpc::Status{ ErrorKind::ClientConstraint
						 , std::move(err)
						 };
			auto resp = Rpc::PaymentResponse();
			resp.payment_err = status.to_string();
			return Router::log( bus, Info
					  , "RouterService: SendPayment rejected: %s"
					  , resp.payment_err.c_str()
					  ).then([resp]() {
				return Ev::lift(resp);
			});
		}
		return dispatcher.send_payment(intent
					      ).then([](Router::PaymentResult r) {
			auto resp = Rpc::PaymentResponse();
			resp.pay_hash = r.payment_hash;
			if (r.succeeded())
				resp.pre_image = r.preimage;
			else
				resp.payment_err = Rpc::Status{ r.error
							      , r.message
							      }.to_string();
			return Ev::lift(resp);
		});
	});
}

Ev::Io<Rpc::RouteFeeResponse>
RouterService::estimate_route_fee(Rpc::RouteFeeRequest req) {
	return Ev::lift().then([this, req]() {
		auto resp = Rpc::RouteFeeResponse();
		if (!req.dest)
			resp.status = Rpc::Status{ ErrorKind::ClientConstraint
						 , "destination required"
						 };
		else if (req.amt_sat <= 0)
			resp.status = Rpc::Status{ ErrorKind::ClientConstraint
						 , "amount must be positive"
						 };
		else if (std::uint64_t(req.amt_sat) > max_int64 / 1000)
			resp.status = Rpc::Status{ ErrorKind::ClientConstraint
						 , "amount too large"
						 };
		else {
			try {
				auto est = estimator.estimate(
					req.dest,
					Ln::Amount::sat(std::uint64_t(req.amt_sat))
				);
				auto fee = est.routing_fee.to_msat();
				/* Saturated fees stay positive.  */
				resp.routing_fee_msat = fee > max_int64
						      ? std::numeric_limits<std::int64_t>::max()
						      : std::int64_t(fee)
						      ;
				resp.time_lock_delay = est.time_lock_delay;
			} catch (NoRouteError const& e) {
				resp.status = Rpc::Status{ ErrorKind::NoRoute
							 , e.what()
							 };
			} catch (ClientConstraintError const& e) {
				resp.status = Rpc::Status{ ErrorKind::ClientConstraint
							 , e.what()
							 };
			}
		}
		if (resp.status.ok())
			return Ev::lift(resp);
		return Router::log( bus, Debug
				  , "RouterService: EstimateRouteFee: %s"
				  , resp.status.to_string().c_str()
				  ).then([resp]() {
			return Ev::lift(resp);
		});
	});
}

Ev::Io<Rpc::SendToRouteResponse>
RouterService::send_to_route(Rpc::SendToRouteRequest req) {
	typedef Util::Either<Ln::Failure, Ln::Preimage> Outcome;
	return dispatcher.send_to_route( req.payment_hash
				       , req.route
				       , config.send_to_route_timeout()
				       ).then([](Outcome o) {
		auto resp = Rpc::SendToRouteResponse();
		if (o.is_right())
			resp.preimage = o.right();
		else
			resp.failure = std::make_shared<Ln::Failure const>(
				o.left()
			);
		return Ev::lift(resp);
	}).catching<ClientConstraintError
		   >([](ClientConstraintError const& e) {
		auto resp = Rpc::SendToRouteResponse();
		resp.status = Rpc::Status{ErrorKind::ClientConstraint, e.what()};
		return Ev::lift(resp);
	}).catching<Waiter::TimedOut>([this](Waiter::TimedOut const& _) {
		auto resp = Rpc::SendToRouteResponse();
		resp.status = Rpc::Status{
			ErrorKind::Timeout,
			"no outcome within "
			+ Util::stringify(config.send_to_route_timeout())
			+ "s"
		};
		return Ev::lift(resp);
	});
}

}}
