#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Router/AttemptSenderIF.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Config.hpp"
#include"Router/FundsAuthorizerIF.hpp"
#include"Router/Mod/PaymentDispatcher.hpp"
#include"Router/Mod/Waiter.hpp"
#include"Router/Msg/AttemptResult.hpp"
#include"Router/Msg/PaymentResult.hpp"
#include"Router/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<cstring>
#include<functional>
#include<memory>
#include<vector>

namespace {

typedef Util::Either<Ln::Failure, Ln::Preimage> Outcome;

Ln::NodeId node(int i) {
	return Ln::NodeId(Util::Str::fmt("02%064x", i));
}

auto const Self = node(1);
auto const B = node(2);
auto const C = node(3);
auto const D = node(4);
auto const E = node(5);

Ln::ChannelUpdate policy( char const* scid
			, std::uint32_t base
			, std::uint16_t delta
			, std::uint32_t ts = 1
			) {
	auto u = Ln::ChannelUpdate();
	u.chan_id = Ln::Scid(scid);
	u.timestamp = ts;
	u.time_lock_delta = delta;
	u.base_fee = base;
	return u;
}

/* Self -> B -> C -> D costs 17msat over 89 blocks;
 * Self -> E -> D costs 2000msat over 20 blocks.  */
void populate(Router::ChannelGraph& g) {
	g.add_channel(Ln::Scid("1x1x1"), Self, B);
	g.add_channel(Ln::Scid("2x2x2"), B, C);
	g.add_channel(Ln::Scid("3x3x3"), C, D);
	g.add_channel(Ln::Scid("4x4x4"), Self, E);
	g.add_channel(Ln::Scid("5x5x5"), E, D);
	g.apply_update(policy("1x1x1", 10, 40));
	g.apply_update(policy("2x2x2", 5, 40));
	g.apply_update(policy("3x3x3", 2, 9));
	g.apply_update(policy("4x4x4", 1000, 10));
	g.apply_update(policy("5x5x5", 1000, 10));
}

Ln::Preimage preimage(int i) {
	std::uint8_t buf[32];
	std::memset(buf, i, sizeof(buf));
	auto p = Ln::Preimage();
	p.from_buffer(buf);
	return p;
}

Router::PaymentIntent intent(int i) {
	auto in = Router::PaymentIntent();
	in.payment_hash = preimage(i).sha256();
	in.destination = D;
	in.amount = Ln::Amount::msat(100000000);
	return in;
}

class DummySender : public Router::AttemptSenderIF {
public:
	typedef std::function<void(Outcome)> PassF;

	/* Decides each attempt; if null, attempts are held
	 * until `resolve`.  */
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
		auto outcome = respond(route);
		return Ev::yield().then([outcome]() {
			return Ev::lift(outcome);
		});
	}
	Ev::Io<void> cancel(Sha256::Hash const& _) override {
		++cancels;
		return Ev::lift();
	}

	void resolve(Outcome o) {
		auto pass = std::move(held.front());
		held.erase(held.begin());
		pass(std::move(o));
	}
};

class DummyWallet : public Router::FundsAuthorizerIF {
public:
	Ln::Amount balance;
	Ln::Amount committed;
	Ln::Amount spent;

	explicit
	DummyWallet(Ln::Amount balance_) : balance(balance_) { }

	Ev::Io<bool>
	authorize(Sha256::Hash const& _, Ln::Amount amount) override {
		if (committed + amount > balance)
			return Ev::lift(false);
		committed += amount;
		return Ev::lift(true);
	}
	Ev::Io<void>
	release(Sha256::Hash const& _, Ln::Amount amount) override {
		assert(committed >= amount);
		committed -= amount;
		return Ev::lift();
	}
	Ev::Io<void>
	settle(Sha256::Hash const& _, Ln::Amount amount) override {
		assert(committed >= amount);
		committed -= amount;
		balance -= amount;
		spent += amount;
		return Ev::lift();
	}
};

std::function<Outcome(Ln::Route const&)> succeed(int i) {
	return [i](Ln::Route const&) {
		return Outcome::right(preimage(i));
	};
}
std::function<Outcome(Ln::Route const&)> fail_at_destination(std::uint32_t code) {
	return [code](Ln::Route const& r) {
		auto f = Ln::Failure();
		f.code = code;
		f.failure_source_pubkey = r.destination();
		return Outcome::left(f);
	};
}

bool contains(std::string const& s, std::string const& sub) {
	return s.find(sub) != std::string::npos;
}

}

int main() {
	S::Bus bus;
	auto config = Router::Config();
	config.set("router-max-attempts", "2");
	auto graph = Router::ChannelGraph();
	populate(graph);
	Router::Mod::Waiter waiter(bus);
	auto sender = DummySender();
	auto wallet = DummyWallet(Ln::Amount::sat(10000000));
	Router::Mod::PaymentDispatcher dispatcher( bus, graph, config, waiter
						 , sender, wallet, Self
						 );

	auto attempts = std::vector<Router::Msg::AttemptResult>();
	auto results = std::vector<Router::PaymentResult>();
	bus.subscribe<Router::Msg::AttemptResult>([&](Router::Msg::AttemptResult const& m) {
		attempts.push_back(m);
		return Ev::lift();
	});
	bus.subscribe<Router::Msg::PaymentResult>([&](Router::Msg::PaymentResult const& m) {
		results.push_back(m.result);
		return Ev::lift();
	});

	auto abort_case = [&](std::uint32_t code, int i) {
		return Ev::lift().then([&, code, i]() {
			sender.respond = fail_at_destination(code);
			auto before = sender.sent.size();
			return dispatcher.send_payment(intent(i)).then([&, before, code](Router::PaymentResult r) {
				assert(r.error == Router::ErrorKind::RemoteFailure);
				assert(r.final_state == Router::PaymentState::TerminalFailure);
				assert(r.attempts == 1);
				assert(sender.sent.size() == before + 1);
				assert(contains(r.message, Ln::failure_code_name(code)));
				assert(attempts.back().decision == "abort");
				assert(wallet.committed == Ln::Amount());
				return Ev::lift();
			});
		});
	};
	auto rejected = [&](Router::PaymentIntent in, std::string const& why) {
		return Ev::lift().then([&, in, why]() {
			auto before = sender.sent.size();
			return dispatcher.send_payment(in).then([&, before, why](Router::PaymentResult r) {
				assert(r.error == Router::ErrorKind::ClientConstraint);
				assert(contains(r.message, why));
				assert(r.attempts == 0);
				assert(sender.sent.size() == before);
				return Ev::lift();
			});
		});
	};

	auto start_time = std::make_shared<double>(0);
	auto first = std::make_shared<Router::PaymentResult>();

	auto code = Ev::lift().then([&]() {

		/* Success on the first attempt.  */
		sender.respond = succeed(1);
		return dispatcher.send_payment(intent(1));
	}).then([&](Router::PaymentResult r) {
		assert(r.succeeded());
		assert(r.error == Router::ErrorKind::None);
		assert(r.payment_hash == preimage(1).sha256());
		assert(r.preimage == preimage(1));
		assert(r.attempts == 1);
		assert(r.final_state == Router::PaymentState::Succeeded);
		assert(r.route.hops.size() == 3);
		assert(r.route.total_fees() == Ln::Amount::msat(17));
		/* Final CLTV delta of 18 rides on the last hop.  */
		assert(r.route.total_cltv() == 89 + 18);
		assert(r.route.hops[2].cltv_delta == 27);

		assert(wallet.committed == Ln::Amount());
		assert(wallet.spent == Ln::Amount::msat(100000017));
		assert(!dispatcher.in_flight(r.payment_hash));

		assert(attempts.size() == 1);
		assert(attempts[0].success);
		assert(attempts[0].attempt == 1);
		assert(attempts[0].decision == "");
		assert(results.size() == 1);
		assert(results[0].succeeded());

		/* A channel failure prunes the channel and
		 * the retry goes around it.  */
		attempts.clear();
		sender.respond = [](Ln::Route const& r) {
			if (r.hops[0].channel == Ln::Scid("1x1x1"))
				return Outcome::left(Ln::Failure(
					Ln::FailureCode::TEMPORARY_CHANNEL_FAILURE, B
				));
			return Outcome::right(preimage(2));
		};
		return dispatcher.send_payment(intent(2));
	}).then([&](Router::PaymentResult r) {
		assert(r.succeeded());
		assert(r.attempts == 2);
		assert(r.route.hops[0].node == E);
		assert(attempts.size() == 2);
		assert(!attempts[0].success);
		assert(attempts[0].failure.is(Ln::FailureCode::TEMPORARY_CHANNEL_FAILURE));
		assert(attempts[0].decision == "prune_edge 2x2x2");
		assert(attempts[1].success);
		assert(attempts[1].attempt == 2);
		assert(wallet.committed == Ln::Amount());
		/* Pruning is private to the payment.  */
		assert(graph.find_edge(Ln::Scid("2x2x2"), B));

		/* Failures about the payment itself abort
		 * after one attempt.  */
		return abort_case(1, 31)
		     + abort_case(3, 33)
		     + abort_case(4, 34)
		     + abort_case(5, 35)
		     ;
	}).then([&]() {

		/* Every route fails until the attempt budget
		 * runs out.  */
		attempts.clear();
		sender.respond = [](Ln::Route const& r) {
			return Outcome::left(Ln::Failure(
				Ln::FailureCode::TEMPORARY_CHANNEL_FAILURE,
				r.hops[0].node
			));
		};
		return dispatcher.send_payment(intent(4));
	}).then([&](Router::PaymentResult r) {
		assert(r.error == Router::ErrorKind::RemoteFailure);
		assert(r.final_state == Router::PaymentState::TerminalFailure);
		assert(r.attempts == 2);
		assert(contains(r.message, "2 attempts failed"));
		assert(contains(r.message, "TEMPORARY_CHANNEL_FAILURE from " + std::string(E)));
		assert(attempts.size() == 2);
		assert(attempts[1].decision == "prune_edge 5x5x5");
		assert(wallet.committed == Ln::Amount());

		/* Unreachable destination.  */
		sender.respond = succeed(5);
		auto in = intent(5);
		in.destination = node(99);
		return dispatcher.send_payment(in);
	}).then([&](Router::PaymentResult r) {
		assert(r.error == Router::ErrorKind::NoRoute);
		assert(r.final_state == Router::PaymentState::TerminalFailure);
		assert(r.attempts == 0);

		/* A zero fee limit leaves no route.  */
		auto in = intent(6);
		in.fee_limit = Ln::Amount();
		return dispatcher.send_payment(in);
	}).then([&](Router::PaymentResult r) {
		assert(r.error == Router::ErrorKind::NoRoute);
		assert(!dispatcher.in_flight(r.payment_hash));

		/* Unusable intents.  */
		auto zero = intent(40);
		zero.amount = Ln::Amount();
		auto self = intent(41);
		self.destination = Self;
		auto no_time = intent(42);
		no_time.timeout_seconds = 0;
		auto tight = intent(43);
		tight.cltv_limit = 10;
		auto no_hash = intent(44);
		no_hash.payment_hash = Sha256::Hash();
		return rejected(zero, "amount")
		     + rejected(self, "self")
		     + rejected(no_time, "timeout")
		     + rejected(tight, "cltv limit")
		     + rejected(no_hash, "hash")
		     ;
	}).then([&]() {

		/* Not enough funds for the first route.  */
		wallet.balance = Ln::Amount::msat(1000);
		return dispatcher.send_payment(intent(9));
	}).then([&](Router::PaymentResult r) {
		assert(r.error == Router::ErrorKind::ClientConstraint);
		assert(contains(r.message, "insufficient funds"));
		assert(r.final_state == Router::PaymentState::TerminalFailure);
		wallet.balance = Ln::Amount::sat(10000000);

		/* The preimage does not match the hash.  */
		sender.respond = succeed(99);
		return dispatcher.send_payment(intent(10));
	}).then([&](Router::PaymentResult r) {
		assert(r.error == Router::ErrorKind::Internal);
		assert(wallet.committed == Ln::Amount());
		assert(!dispatcher.in_flight(r.payment_hash));

		/* CLTV limit covers the final delta.  */
		sender.respond = succeed(12);
		auto in = intent(12);
		in.cltv_limit = 107;
		return dispatcher.send_payment(in);
	}).then([&](Router::PaymentResult r) {
		assert(r.succeeded());
		assert(r.route.total_cltv() == 107);
		assert(r.route.hops[0].node == B);

		sender.respond = succeed(13);
		auto in = intent(13);
		in.cltv_limit = 106;
		return dispatcher.send_payment(in);
	}).then([&](Router::PaymentResult r) {
		assert(r.succeeded());
		assert(r.route.total_cltv() == 38);
		assert(r.route.hops[0].node == E);

		/* Required first hop.  */
		sender.respond = succeed(14);
		auto in = intent(14);
		in.first_hop = Ln::Scid("4x4x4");
		return dispatcher.send_payment(in);
	}).then([&](Router::PaymentResult r) {
		assert(r.succeeded());
		assert(r.route.hops[0].channel == Ln::Scid("4x4x4"));

		/* A second payment with a hash in flight is
		 * rejected at once.  */
		sender.respond = nullptr;
		return Ev::concurrent(dispatcher.send_payment(intent(8)).then([first](Router::PaymentResult r) {
			*first = r;
			return Ev::lift();
		}));
	}).then([&]() {
		return Ev::yield(10);
	}).then([&]() {
		assert(sender.held.size() == 1);
		assert(dispatcher.in_flight(preimage(8).sha256()));
		return dispatcher.send_payment(intent(8));
	}).then([&](Router::PaymentResult r) {
		assert(r.error == Router::ErrorKind::AlreadyInFlight);
		assert(r.attempts == 0);
		/* The first one is unaffected.  */
		assert(dispatcher.in_flight(preimage(8).sha256()));
		assert(sender.held.size() == 1);

		sender.resolve(Outcome::right(preimage(8)));
		return Ev::yield(10);
	}).then([&]() {
		assert(first->succeeded());
		assert(first->attempts == 1);
		assert(!dispatcher.in_flight(preimage(8).sha256()));

		/* An attempt that never resolves times out.  */
		sender.respond = nullptr;
		sender.cancels = 0;
		*start_time = Ev::now();
		auto in = intent(7);
		in.timeout_seconds = 1;
		return dispatcher.send_payment(in);
	}).then([&](Router::PaymentResult r) {
		auto elapsed = Ev::now() - *start_time;
		assert(elapsed >= 0.5);
		assert(elapsed < 5);
		assert(r.error == Router::ErrorKind::Timeout);
		assert(r.final_state == Router::PaymentState::TimedOut);
		assert(r.attempts == 1);
		assert(sender.cancels == 1);
		assert(!dispatcher.in_flight(r.payment_hash));
		assert(results.back().error == Router::ErrorKind::Timeout);
		/* Funds stay committed until the attempt resolves.  */
		assert(wallet.committed == Ln::Amount::msat(100000017));

		sender.resolve(Outcome::left(Ln::Failure(
			Ln::FailureCode::TEMPORARY_CHANNEL_FAILURE, B
		)));
		return Ev::yield(10);
	}).then([&]() {
		assert(wallet.committed == Ln::Amount());

		/* An update carried by a failure goes into the
		 * shared graph, and the retry uses it.  */
		attempts.clear();
		sender.respond = [](Ln::Route const& r) {
			if (r.hops[1].channel == Ln::Scid("2x2x2") && r.hops[1].fee == Ln::Amount::msat(5)) {
				auto f = Ln::Failure(Ln::FailureCode::FEE_INSUFFICIENT, B);
				f.channel_update = std::make_shared<Ln::ChannelUpdate>(
					policy("2x2x2", 6, 40, 2)
				);
				return Outcome::left(f);
			}
			return Outcome::right(preimage(11));
		};
		return dispatcher.send_payment(intent(11));
	}).then([&](Router::PaymentResult r) {
		assert(r.succeeded());
		assert(r.attempts == 2);
		assert(r.route.hops[1].channel == Ln::Scid("2x2x2"));
		assert(r.route.total_fees() == Ln::Amount::msat(18));
		assert(attempts[0].decision == "apply_update 2x2x2");
		assert(graph.find_edge(Ln::Scid("2x2x2"), B)->policy.base_fee == 6);

		return bus.raise(Router::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
