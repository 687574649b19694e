#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Ln/Preimage.hpp"
#include"Router/AttemptSenderIF.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Config.hpp"
#include"Router/FundsAuthorizerIF.hpp"
#include"Router/Main.hpp"
#include"Router/Mod/PaymentDispatcher.hpp"
#include"Router/Mod/RouterService.hpp"
#include"Router/Msg/AttemptResult.hpp"
#include"Router/Msg/ChannelAnnouncement.hpp"
#include"Router/Msg/ChannelClosed.hpp"
#include"Router/Msg/ChannelUpdate.hpp"
#include"Router/Rpc.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/Detail/context.hpp"
#include"Sha256/fun.hpp"
#include"Util/Bech32.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<cstring>
#include<functional>
#include<iterator>
#include<limits>
#include<secp256k1.h>
#include<secp256k1_recovery.h>
#include<sstream>
#include<vector>

namespace {

typedef Util::Either<Ln::Failure, Ln::Preimage> Outcome;
typedef std::vector<std::uint8_t> Words;

std::uint8_t const payee_key[32] =
{ 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12
, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12
, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12
, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12, 0x12
};

Ln::NodeId payee() {
	auto ctx = Secp256k1::Detail::context.get();
	secp256k1_pubkey pk;
	assert(secp256k1_ec_pubkey_create(ctx, &pk, payee_key));
	std::uint8_t buf[33];
	auto size = sizeof(buf);
	assert(secp256k1_ec_pubkey_serialize(ctx, buf, &size, &pk, SECP256K1_EC_COMPRESSED));
	return Ln::NodeId::from_buffer(buf);
}

void put_uint(Words& w, std::uint64_t v, std::size_t len) {
	for (auto i = len; i > 0; --i)
		w.push_back(std::uint8_t((v >> (5 * (i - 1))) & 0x1F));
}
void put_bytes(Words& w, std::uint8_t type, std::uint8_t const* p, std::size_t n) {
	auto data = Words();
	Util::Bech32::bytes_to_words(p, p + n, std::back_inserter(data));
	w.push_back(type);
	w.push_back(std::uint8_t(data.size() / 32));
	w.push_back(std::uint8_t(data.size() % 32));
	w.insert(w.end(), data.begin(), data.end());
}

/* Payment request signed by the payee, with a
 * 40-block final CLTV delta.  */
std::string invoice( std::string const& hrp
		   , Sha256::Hash const& hash
		   , std::uint64_t timestamp
		   ) {
	auto data = Words();
	put_uint(data, timestamp, 7);
	std::uint8_t buf[32];
	hash.to_buffer(buf);
	put_bytes(data, 1, buf, sizeof(buf));
	data.push_back(24);
	data.push_back(0);
	data.push_back(2);
	put_uint(data, 40, 2);

	auto msg = std::vector<std::uint8_t>(hrp.begin(), hrp.end());
	Util::Bech32::words_to_bytes(data.begin(), data.end(), std::back_inserter(msg));
	std::uint8_t digest[32];
	Sha256::fun(msg).to_buffer(digest);

	auto ctx = Secp256k1::Detail::context.get();
	secp256k1_ecdsa_recoverable_signature rsig;
	assert(secp256k1_ecdsa_sign_recoverable(ctx, &rsig, digest, payee_key, nullptr, nullptr));
	auto sig = std::vector<std::uint8_t>(65);
	auto recid = int();
	assert(secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, &sig[0], &recid, &rsig));
	sig[64] = std::uint8_t(recid);
	Util::Bech32::bytes_to_words(sig.begin(), sig.end(), std::back_inserter(data));

	return Util::Bech32::encode(hrp, data);
}

Ln::NodeId node(int i) {
	return Ln::NodeId(Util::Str::fmt("02%064x", i));
}

Ln::Preimage preimage(int i) {
	std::uint8_t buf[32];
	std::memset(buf, i, sizeof(buf));
	auto p = Ln::Preimage();
	p.from_buffer(buf);
	return p;
}

Ln::ChannelUpdate policy( char const* scid
			, std::uint32_t base
			, std::uint16_t delta
			) {
	auto u = Ln::ChannelUpdate();
	u.chan_id = Ln::Scid(scid);
	u.timestamp = 1;
	u.time_lock_delta = delta;
	u.base_fee = base;
	return u;
}

class DummySender : public Router::AttemptSenderIF {
public:
	typedef std::function<void(Outcome)> PassF;

	/* If null, attempts never resolve.  */
	std::function<Outcome(Ln::Route const&)> respond;
	std::vector<Ln::Route> sent;
	std::vector<PassF> held;
	std::size_t cancels = 0;

	Ev::Io<Outcome>
	send(Sha256::Hash const& _, Ln::Route const& route) override {
		sent.push_back(route);
		if (!respond)
			return Ev::Io<Outcome>([this]( PassF pass
						     , std::function<void(std::exception_ptr)> _
						     ) {
				held.push_back(std::move(pass));
			});
		return Ev::lift(respond(route));
	}
	Ev::Io<void> cancel(Sha256::Hash const& _) override {
		++cancels;
		return Ev::lift();
	}
};

class DummyFunds : public Router::FundsAuthorizerIF {
public:
	Ln::Amount committed;
	Ln::Amount spent;

	Ev::Io<bool>
	authorize(Sha256::Hash const& _, Ln::Amount amount) override {
		committed += amount;
		return Ev::lift(true);
	}
	Ev::Io<void>
	release(Sha256::Hash const& _, Ln::Amount amount) override {
		committed -= amount;
		return Ev::lift();
	}
	Ev::Io<void>
	settle(Sha256::Hash const& _, Ln::Amount amount) override {
		committed -= amount;
		spent += amount;
		return Ev::lift();
	}
};

bool starts_with(std::string const& s, std::string const& prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}
bool contains(std::string const& s, std::string const& sub) {
	return s.find(sub) != std::string::npos;
}

}

int main() {
	auto const self = node(1);
	auto const B = node(2);
	auto const D = payee();

	auto config = Router::Config();
	config.set("router-send-to-route-timeout", "1");
	auto log = std::ostringstream();
	auto sender = DummySender();
	auto funds = DummyFunds();
	auto router = Router::Main(config, log, sender, funds, self);
	auto& bus = router.bus();
	auto& service = router.service();

	auto now = std::uint64_t(Ev::now());

	auto attempts = std::size_t(0);
	bus.subscribe<Router::Msg::AttemptResult>([&](Router::Msg::AttemptResult const& _) {
		++attempts;
		return Ev::lift();
	});

	auto route = Ln::Route();
	route.hops.push_back(Ln::Hop{
		Ln::Scid("1x1x1"), B, Ln::Amount::msat(100000015),
		Ln::Amount::msat(10), 40
	});
	route.hops.push_back(Ln::Hop{
		Ln::Scid("2x2x2"), D, Ln::Amount::msat(100000005),
		Ln::Amount::msat(5), 49
	});

	auto code = Ev::lift().then([&]() {
		/* Graph feed: self -> B -> D.  */
		return bus.raise(Router::Msg::ChannelAnnouncement{
			Ln::Scid("1x1x1"), self, B
		})
		     + bus.raise(Router::Msg::ChannelAnnouncement{
			Ln::Scid("2x2x2"), B, D
		})
		     + bus.raise(Router::Msg::ChannelUpdate{
			policy("1x1x1", 10, 40)
		})
		     + bus.raise(Router::Msg::ChannelUpdate{
			policy("2x2x2", 5, 9)
		})
		     ;
	}).then([&]() {
		assert(router.graph().num_channels() == 2);
		assert(router.graph().find_edge(Ln::Scid("2x2x2"), B));

		auto req = Router::Rpc::RouteFeeRequest();
		req.dest = D;
		req.amt_sat = 100000;
		return service.estimate_route_fee(req);
	}).then([&](Router::Rpc::RouteFeeResponse r) {
		assert(r.status.ok());
		assert(r.status.to_string() == "");
		assert(r.routing_fee_msat == 15);
		assert(r.time_lock_delay == 49);

		auto req = Router::Rpc::RouteFeeRequest();
		req.dest = D;
		req.amt_sat = 0;
		return service.estimate_route_fee(req);
	}).then([&](Router::Rpc::RouteFeeResponse r) {
		assert(r.status.kind == Router::ErrorKind::ClientConstraint);
		assert(starts_with(r.status.to_string(), "client_constraint: "));

		auto req = Router::Rpc::RouteFeeRequest();
		req.dest = node(99);
		req.amt_sat = 1;
		return service.estimate_route_fee(req);
	}).then([&](Router::Rpc::RouteFeeResponse r) {
		assert(r.status.kind == Router::ErrorKind::NoRoute);

		/* Pay a request for 1 mBTC.  */
		sender.respond = [](Ln::Route const&) {
			return Outcome::right(preimage(7));
		};
		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt1m", preimage(7).sha256(), now);
		req.fee_limit_sat = 1;
		req.timeout_seconds = 10;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(r.payment_err == "");
		assert(r.pay_hash == preimage(7).sha256());
		assert(r.pre_image == preimage(7));
		assert(sender.sent.size() == 1);
		auto const& sent = sender.sent.back();
		assert(sent.hops.size() == 2);
		assert(sent.hops.back().node == D);
		assert(sent.hops.back().amount == Ln::Amount::msat(100000005));
		/* Final CLTV delta from the payment request.  */
		assert(sent.hops.back().cltv_delta == 9 + 40);
		assert(sent.total_fees() == Ln::Amount::msat(15));
		assert(funds.spent == Ln::Amount::msat(100000015));
		assert(attempts == 1);

		/* No fee allowance.  */
		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt1m", preimage(8).sha256(), now);
		req.fee_limit_sat = 0;
		req.timeout_seconds = 10;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(starts_with(r.payment_err, "no_route: "));
		assert(r.pay_hash == preimage(8).sha256());

		/* Unknown required first hop.  */
		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt1m", preimage(9).sha256(), now);
		req.fee_limit_sat = 1;
		req.timeout_seconds = 10;
		req.outgoing_channel_id = std::int64_t(Ln::Scid("9x9x9").to_u64());
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(starts_with(r.payment_err, "no_route: "));

		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = "lnbcrt1garbage";
		req.timeout_seconds = 10;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(starts_with(r.payment_err, "client_constraint: invalid payment request"));
		assert(!r.pay_hash);

		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt1m", preimage(10).sha256(), now);
		req.fee_limit_sat = -1;
		req.timeout_seconds = 10;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(r.payment_err == "client_constraint: fee limit must not be negative");

		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt1m", preimage(10).sha256(), now);
		req.fee_limit_sat = 1;
		req.timeout_seconds = 0;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(r.payment_err == "client_constraint: timeout must be positive");

		/* Default expiry is an hour.  */
		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt1m", preimage(10).sha256(), now - 7200);
		req.fee_limit_sat = 1;
		req.timeout_seconds = 10;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(r.payment_err == "client_constraint: payment request expired");

		auto req = Router::Rpc::PaymentRequest();
		req.pay_req = invoice("lnbcrt", preimage(10).sha256(), now);
		req.fee_limit_sat = 1;
		req.timeout_seconds = 10;
		return service.send_payment(req);
	}).then([&](Router::Rpc::PaymentResponse r) {
		assert(r.payment_err == "client_constraint: payment request has no amount");
		assert(sender.sent.size() == 1);

		/* One attempt over a caller-supplied route.  */
		sender.respond = [](Ln::Route const&) {
			return Outcome::right(preimage(11));
		};
		auto req = Router::Rpc::SendToRouteRequest();
		req.payment_hash = preimage(11).sha256();
		req.route = route;
		return service.send_to_route(req);
	}).then([&](Router::Rpc::SendToRouteResponse r) {
		assert(r.status.ok());
		assert(!r.failure);
		assert(r.preimage == preimage(11));
		assert(sender.sent.back() == route);
		assert(funds.committed == Ln::Amount());

		sender.respond = [&](Ln::Route const&) {
			return Outcome::left(Ln::Failure(
				Ln::FailureCode::TEMPORARY_CHANNEL_FAILURE, B
			));
		};
		auto req = Router::Rpc::SendToRouteRequest();
		req.payment_hash = preimage(12).sha256();
		req.route = route;
		return service.send_to_route(req);
	}).then([&](Router::Rpc::SendToRouteResponse r) {
		assert(r.status.ok());
		assert(r.failure);
		assert(r.failure->is(Ln::FailureCode::TEMPORARY_CHANNEL_FAILURE));
		assert(r.failure->failure_source_pubkey == B);
		assert(funds.committed == Ln::Amount());
		/* A failure is reported, never retried.  */
		assert(sender.sent.size() == 3);

		auto req = Router::Rpc::SendToRouteRequest();
		req.payment_hash = preimage(13).sha256();
		return service.send_to_route(req);
	}).then([&](Router::Rpc::SendToRouteResponse r) {
		assert(r.status.kind == Router::ErrorKind::ClientConstraint);
		assert(r.status.message == "route is empty");
		assert(sender.sent.size() == 3);

		/* No outcome within the configured timeout.  */
		sender.respond = nullptr;
		auto req = Router::Rpc::SendToRouteRequest();
		req.payment_hash = preimage(14).sha256();
		req.route = route;
		return service.send_to_route(req);
	}).then([&](Router::Rpc::SendToRouteResponse r) {
		assert(r.status.kind == Router::ErrorKind::Timeout);
		assert(!r.failure);
		assert(sender.cancels == 1);
		assert(funds.committed == Ln::Amount());

		/* Closing a channel takes it out of routing.  */
		return bus.raise(Router::Msg::ChannelClosed{Ln::Scid("2x2x2")});
	}).then([&]() {
		assert(router.graph().num_channels() == 1);
		auto req = Router::Rpc::RouteFeeRequest();
		req.dest = D;
		req.amt_sat = 100000;
		return service.estimate_route_fee(req);
	}).then([&](Router::Rpc::RouteFeeResponse r) {
		assert(r.status.kind == Router::ErrorKind::NoRoute);

		/* B -> E charges more than an int64 can report.  */
		auto u = policy("3x3x3", 0, 6);
		u.fee_rate = 4000000000u;
		return bus.raise(Router::Msg::ChannelAnnouncement{
			Ln::Scid("3x3x3"), B, node(5)
		})
		     + bus.raise(Router::Msg::ChannelUpdate{u})
		     ;
	}).then([&]() {
		auto req = Router::Rpc::RouteFeeRequest();
		req.dest = node(5);
		req.amt_sat = 10000000000000;
		return service.estimate_route_fee(req);
	}).then([&](Router::Rpc::RouteFeeResponse r) {
		assert(r.status.ok());
		assert(r.routing_fee_msat == std::numeric_limits<std::int64_t>::max());
		assert(r.time_lock_delay == 46);

		/* Too large to express in millisatoshi.  */
		auto req = Router::Rpc::RouteFeeRequest();
		req.dest = node(5);
		req.amt_sat = std::numeric_limits<std::int64_t>::max();
		return service.estimate_route_fee(req);
	}).then([&](Router::Rpc::RouteFeeResponse r) {
		assert(r.status.kind == Router::ErrorKind::ClientConstraint);
		assert(r.status.message == "amount too large");
		return Ev::yield(10);
	}).then([&]() {
		/* Payments are logged at info level.  */
		auto out = log.str();
		assert(contains(out, "{\"level\": \"info\", \"message\": \"PaymentDispatcher: "));
		assert(!contains(out, "\"level\": \"debug\""));

		return router.shutdown();
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
