#include"Ln/Failure.hpp"
#include"Ln/Route.hpp"
#include"Router/Error.hpp"
#include"Router/FailureInterpreter.hpp"
#include"Util/Str.hpp"
#include<cstddef>

namespace {

enum Class
{ Reserved
, Payment
, Channel
, Node
};

/* Indexed by Ln::FailureCode.  */
Class const table[] =
{ Reserved	/* RESERVED */
, Payment	/* UNKNOWN_PAYMENT_HASH */
, Payment	/* INCORRECT_PAYMENT_AMOUNT */
, Payment	/* FINAL_INCORRECT_CLTV_EXPIRY */
, Payment	/* FINAL_INCORRECT_HTLC_AMOUNT */
, Payment	/* FINAL_EXPIRY_TOO_SOON */
, Payment	/* INVALID_REALM */
, Channel	/* EXPIRY_TOO_SOON */
, Channel	/* INVALID_ONION_VERSION */
, Channel	/* INVALID_ONION_HMAC */
, Channel	/* INVALID_ONION_KEY */
, Channel	/* AMOUNT_BELOW_MINIMUM */
, Channel	/* FEE_INSUFFICIENT */
, Channel	/* INCORRECT_CLTV_EXPIRY */
, Channel	/* CHANNEL_DISABLED */
, Channel	/* TEMPORARY_CHANNEL_FAILURE */
, Node		/* REQUIRED_NODE_FEATURE_MISSING */
, Node		/* REQUIRED_CHANNEL_FEATURE_MISSING */
, Node		/* UNKNOWN_NEXT_PEER */
, Node		/* TEMPORARY_NODE_FAILURE */
, Node		/* PERMANENT_NODE_FAILURE */
, Channel	/* PERMANENT_CHANNEL_FAILURE */
};
auto const table_size = sizeof(table) / sizeof(table[0]);
static_assert( table_size
	    == std::size_t(Ln::FailureCode::PERMANENT_CHANNEL_FAILURE) + 1
	     , "failure table must cover every code"
	     );

}

namespace Router {

Decision Decision::prune_edge(Ln::Scid channel) {
	auto rv = Decision();
	rv.kind = PruneEdge;
	rv.channel = channel;
	return rv;
}
Decision Decision::prune_node(Ln::NodeId node) {
	auto rv = Decision();
	rv.kind = PruneNode;
	rv.node = std::move(node);
	return rv;
}
Decision Decision::abort() {
	return Decision();
}
Decision
Decision::apply_update( Ln::Scid channel
		      , std::shared_ptr<Ln::ChannelUpdate const> update
		      ) {
	auto rv = Decision();
	rv.kind = ApplyUpdateAndRetry;
	rv.channel = channel;
	rv.update = std::move(update);
	return rv;
}

std::string to_string(Decision const& d) {
	switch (d.kind) {
	case Decision::PruneEdge:
		return "prune_edge " + std::string(d.channel);
	case Decision::PruneNode:
		return "prune_node " + std::string(d.node);
	case Decision::Abort:
		return "abort";
	case Decision::ApplyUpdateAndRetry:
		return "apply_update " + std::string(d.channel);
	}
	return "unknown";
}

Decision
FailureInterpreter::interpret( Ln::Failure const& f
			     , Ln::Route const& route
			     ) const {
	if (route.empty())
		throw InternalError("FailureInterpreter: failure on empty route");

	auto const& hops = route.hops;
	auto const& source = f.failure_source_pubkey;

	/* Position of the failing node: 0 is the sender,
	 * i + 1 is the node reached by hops[i].  */
	auto pos = std::size_t(0);
	if (source && source == self)
		pos = 0;
	else {
		auto i = std::size_t(0);
		for (; i < hops.size(); ++i)
			if (hops[i].node == source)
				break;
		if (!source || i == hops.size())
			throw InternalError(Util::Str::fmt(
				"FailureInterpreter: "
				"failure source %s is not on the route",
				std::string(source).c_str()
			));
		pos = i + 1;
	}
	auto const is_final = pos == hops.size();
	/* Channel leading into the failing node, or the
	 * first channel if the sender itself failed.  */
	auto const& incoming = hops[pos == 0 ? 0 : pos - 1].channel;
	/* Channel the failing node was to forward over;
	 * the final node has none, so take its incoming
	 * channel.  */
	auto const& outgoing = hops[is_final ? pos - 1 : pos].channel;

	if (f.code >= table_size)
		return Decision::prune_edge(incoming);

	switch (table[f.code]) {
	case Reserved:
		throw InternalError(
			"FailureInterpreter: reserved failure code 0"
		);
	case Payment:
		return Decision::abort();
	case Channel:
		if (f.channel_update)
			return Decision::apply_update( outgoing
						     , f.channel_update
						     );
		return Decision::prune_edge(outgoing);
	case Node:
		if (pos == 0 || is_final)
			return Decision::abort();
		return Decision::prune_node(source);
	}
	throw InternalError("FailureInterpreter: unclassified failure code");
}

}
