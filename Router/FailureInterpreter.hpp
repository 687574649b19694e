#ifndef ROUTER_FAILUREINTERPRETER_HPP
#define ROUTER_FAILUREINTERPRETER_HPP

#include"Ln/ChannelUpdate.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"
#include<memory>
#include<string>

namespace Ln { struct Failure; }
namespace Ln { struct Route; }

namespace Router {

/** struct Router::Decision
 *
 * @brief what to do after an attempt failed.
 *
 * @desc `channel` is set for PruneEdge and
 * ApplyUpdateAndRetry, `node` for PruneNode, and
 * `update` for ApplyUpdateAndRetry.
 */
struct Decision {
	enum Kind
	{ PruneEdge
	, PruneNode
	, Abort
	, ApplyUpdateAndRetry
	};
	Kind kind;
	Ln::Scid channel;
	Ln::NodeId node;
	std::shared_ptr<Ln::ChannelUpdate const> update;

	Decision() : kind(Abort) { }

	static Decision prune_edge(Ln::Scid);
	static Decision prune_node(Ln::NodeId);
	static Decision abort();
	static Decision apply_update( Ln::Scid
				    , std::shared_ptr<Ln::ChannelUpdate const>
				    );
};

/* "prune_edge 700000x1x0", "abort", ...  */
std::string to_string(Decision const&);

/** class Router::FailureInterpreter
 *
 * @brief classifies the failure of an attempt into
 * a decision, using a table covering every failure
 * code.
 *
 * @desc Codes about the payment itself abort.
 * Codes about a channel prune the channel the
 * failing node was to forward over, or ask for the
 * attached channel update to be applied.
 * Codes about a node prune that node, unless it is
 * the sender or the destination, which cannot be
 * routed around, in which case the payment aborts.
 * Codes outside the table prune the channel leading
 * into the failing node.
 *
 * The reserved code 0, and failures from a node not
 * on the route, throw Router::InternalError.
 */
class FailureInterpreter {
private:
	Ln::NodeId self;

public:
	explicit
	FailureInterpreter(Ln::NodeId self_) : self(std::move(self_)) { }

	Decision interpret( Ln::Failure const& failure
			  , Ln::Route const& route
			  ) const;
};

}

#endif /* !defined(ROUTER_FAILUREINTERPRETER_HPP) */
