#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"Ln/ChannelUpdate.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Route.hpp"
#include"Ln/Scid.hpp"
#include"Router/ChannelGraph.hpp"
#include"Router/Config.hpp"
#include"Router/Error.hpp"
#include"Router/RouteFinder.hpp"
#include"Util/Str.hpp"
#include<fstream>
#include<iostream>
#include<sstream>
#include<string>

/*
Graph file, one item per line:

  channel <scid> <node_1> <node_2>
  policy <scid> <direction> <base_fee_msat> <fee_rate_ppm> <cltv_delta> [disabled]
  update <channel_update body in hex>

Blank lines and lines starting with # are ignored.
*/

namespace {

int load_graph(Router::ChannelGraph& graph, std::istream& is) {
	auto line = std::string();
	auto lineno = 0;
	auto timestamp = std::uint32_t(1);
	while (std::getline(is, line)) {
		++lineno;
		auto ls = std::istringstream(line);
		auto kind = std::string();
		ls >> kind;
		if (kind.empty() || kind[0] == '#')
			continue;
		if (kind == "channel") {
			auto scid = Ln::Scid();
			auto n1 = Ln::NodeId();
			auto n2 = Ln::NodeId();
			ls >> scid >> n1 >> n2;
			if (!ls) {
				std::cerr << "line " << lineno
					  << ": bad channel" << std::endl;
				return 1;
			}
			graph.add_channel(scid, n1, n2);
		} else if (kind == "policy") {
			auto u = Ln::ChannelUpdate();
			auto dir = int();
			auto delta = std::uint32_t();
			auto flag = std::string();
			ls >> u.chan_id >> dir >> u.base_fee >> u.fee_rate >> delta;
			if (!ls) {
				std::cerr << "line " << lineno
					  << ": bad policy" << std::endl;
				return 1;
			}
			ls >> flag;
			u.timestamp = timestamp++;
			u.channel_flags = (dir ? 0x01 : 0x00)
					| (flag == "disabled" ? 0x02 : 0x00)
					;
			u.time_lock_delta = std::uint16_t(delta);
			graph.apply_update(u);
		} else if (kind == "update") {
			auto hex = std::string();
			ls >> hex;
			graph.apply_update(Ln::ChannelUpdate::parse(
				Util::Str::hexread(hex)
			));
		} else {
			std::cerr << "line " << lineno
				  << ": unknown item " << kind << std::endl;
			return 1;
		}
	}
	return 0;
}

}

int main(int argc, char** argv) {
	if (argc != 5 && argc != 6) {
		std::cerr << "Usage: dev-route graphfile source destination amount [configfile]"
			  << std::endl;
		return 1;
	}
	try {
		auto config = Router::Config();
		if (argc == 6) {
			auto cf = std::ifstream(argv[5]);
			config.load(cf);
		}

		auto graph = Router::ChannelGraph();
		auto gf = std::ifstream(argv[1]);
		if (!gf) {
			std::cerr << "Cannot open " << argv[1] << std::endl;
			return 1;
		}
		auto rc = load_graph(graph, gf);
		if (rc != 0)
			return rc;

		auto q = Router::RouteQuery();
		q.source = Ln::NodeId(argv[2]);
		q.destination = Ln::NodeId(argv[3]);
		q.amount = Ln::Amount(argv[4]);

		auto finder = Router::RouteFinder(graph, config);
		auto route = finder.find_route(q);

		/* One line for the route, then one per hop.  */
		std::cout << Json::Out()
			.start_object()
				.field("total_amount", std::string(route.total_amount()))
				.field("total_fees", std::string(route.total_fees()))
				.field("total_cltv", route.total_cltv())
				.field("hops", route.hops.size())
			.end_object()
			.output()
			  << std::endl;
		for (auto const& h : route.hops)
			std::cout << Json::Out()
				.start_object()
					.field("channel", std::string(h.channel))
					.field("node", std::string(h.node))
					.field("amount", std::string(h.amount))
					.field("fee", std::string(h.fee))
					.field("cltv_delta", h.cltv_delta)
				.end_object()
				.output()
				  << std::endl;
	} catch (Router::NoRouteError const& e) {
		std::cerr << "No route: " << e.what() << std::endl;
		return 2;
	} catch (std::exception const& e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}
	return 0;
}
