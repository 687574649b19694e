#undef NDEBUG
#include"Router/ChannelGraph.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<atomic>
#include<thread>
#include<vector>

namespace {

Ln::NodeId node(int i) {
	return Ln::NodeId(Util::Str::fmt("02%064x", i));
}

Ln::ChannelUpdate policy( char const* scid
			, int dir
			, std::uint32_t base
			, std::uint32_t ts
			, bool disabled = false
			) {
	auto u = Ln::ChannelUpdate();
	u.chan_id = Ln::Scid(scid);
	u.timestamp = ts;
	u.channel_flags = (dir ? 0x01 : 0x00) | (disabled ? 0x02 : 0x00);
	u.time_lock_delta = 40;
	u.base_fee = base;
	return u;
}

}

int main() {
	auto A = node(1);
	auto B = node(2);
	auto C = node(3);

	/* Channels.  */
	{
		auto g = Router::ChannelGraph();
		assert(g.num_channels() == 0);
		assert(g.add_channel(Ln::Scid("1x1x1"), A, B));
		assert(!g.add_channel(Ln::Scid("1x1x1"), A, C));
		assert(!g.add_channel(Ln::Scid("2x2x2"), A, A));
		assert(!g.add_channel(Ln::Scid(), A, B));
		assert(!g.add_channel(Ln::Scid("2x2x2"), A, Ln::NodeId()));
		assert(g.add_channel(Ln::Scid("2x2x2"), B, C));
		assert(g.num_channels() == 2);
		assert(g.has_channel(Ln::Scid("2x2x2")));

		/* No policy yet.  */
		assert(g.edges_from(A).empty());
		assert(!g.find_edge(Ln::Scid("1x1x1"), A));

		assert(g.remove_channel(Ln::Scid("2x2x2")));
		assert(!g.remove_channel(Ln::Scid("2x2x2")));
		assert(!g.has_channel(Ln::Scid("2x2x2")));
		assert(g.num_channels() == 1);
	}

	/* Policies and directions.  */
	{
		auto g = Router::ChannelGraph();
		g.add_channel(Ln::Scid("1x1x1"), A, B);
		g.add_channel(Ln::Scid("2x2x2"), B, C);

		assert(!g.apply_update(policy("9x9x9", 0, 1, 1)));
		assert(g.apply_update(policy("1x1x1", 0, 10, 100)));

		auto out = g.edges_from(A);
		assert(out.size() == 1);
		assert(out[0].channel == Ln::Scid("1x1x1"));
		assert(out[0].from == A);
		assert(out[0].to == B);
		assert(out[0].policy.base_fee == 10);
		/* Only the announced direction is routable.  */
		assert(g.edges_from(B).empty());
		assert(g.edges_to(B).size() == 1);
		assert(g.edges_to(A).empty());

		/* Staleness.  */
		assert(!g.apply_update(policy("1x1x1", 0, 20, 100)));
		assert(!g.apply_update(policy("1x1x1", 0, 20, 99)));
		assert(g.find_edge(Ln::Scid("1x1x1"), A)->policy.base_fee == 10);
		assert(g.apply_update(policy("1x1x1", 0, 20, 101)));
		assert(g.find_edge(Ln::Scid("1x1x1"), A)->policy.base_fee == 20);

		/* Directions are independent.  */
		assert(g.apply_update(policy("1x1x1", 1, 5, 50)));
		assert(g.edges_from(B).size() == 1);
		assert(g.edges_from(B)[0].to == A);
		assert(g.find_edge(Ln::Scid("1x1x1"), B)->policy.base_fee == 5);

		/* Disabled edges are not routable but can be found.  */
		assert(g.apply_update(policy("1x1x1", 0, 20, 102, true)));
		assert(g.edges_from(A).empty());
		auto e = g.find_edge(Ln::Scid("1x1x1"), A);
		assert(e);
		assert(e->policy.disabled());

		/* Not an endpoint.  */
		assert(!g.find_edge(Ln::Scid("1x1x1"), C));

		/* Removal drops both directions.  */
		g.apply_update(policy("2x2x2", 0, 1, 1));
		assert(g.edges_to(C).size() == 1);
		g.remove_channel(Ln::Scid("2x2x2"));
		assert(g.edges_to(C).empty());
		assert(!g.apply_update(policy("2x2x2", 0, 1, 2)));
	}

	/* Concurrent updates and reads.  */
	{
		auto g = Router::ChannelGraph();
		for (auto i = 1; i <= 50; ++i)
			g.add_channel(Ln::Scid::make(i, 0, 0), A, node(100 + i));

		auto applied = std::atomic<int>(0);
		auto threads = std::vector<std::thread>();
		for (auto t = 0; t < 4; ++t) {
			threads.emplace_back([&g, &applied, &A, t]() {
				for (auto ts = std::uint32_t(1); ts <= 20; ++ts) {
					for (auto i = 1; i <= 50; ++i) {
						auto u = Ln::ChannelUpdate();
						u.chan_id = Ln::Scid::make(i, 0, 0);
						u.timestamp = ts * 4 + t;
						u.base_fee = u.timestamp;
						if (g.apply_update(u))
							++applied;
					}
					(void) g.edges_from(A);
				}
			});
		}
		for (auto& th : threads)
			th.join();

		/* Each channel ends with the newest update.  */
		for (auto i = 1; i <= 50; ++i) {
			auto e = g.find_edge(Ln::Scid::make(i, 0, 0), A);
			assert(e);
			assert(e->policy.timestamp == 20 * 4 + 3);
			assert(e->policy.base_fee == 83);
		}
		assert(applied >= 50);
		assert(g.edges_from(A).size() == 50);
	}

	return 0;
}
