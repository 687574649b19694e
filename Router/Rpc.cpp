#include"Router/Rpc.hpp"

namespace Router { namespace Rpc {

std::string Status::to_string() const {
	if (ok())
		return "";
	return Router::error_kind_name(kind) + ": " + message;
}

}}
