#include"Ln/Route.hpp"

namespace Ln {

std::ostream& operator<<(std::ostream& os, Route const& r) {
	auto first = true;
	for (auto const& h : r.hops) {
		if (!first)
			os << " ";
		first = false;
		os << h.channel << "->" << h.node
		   << "(" << h.amount << ")"
		    ;
	}
	return os;
}

}
