#include"Router/Error.hpp"

namespace Router {

std::string error_kind_name(ErrorKind k) {
	switch (k) {
	case ErrorKind::None: return "none";
	case ErrorKind::ClientConstraint: return "client_constraint";
	case ErrorKind::NoRoute: return "no_route";
	case ErrorKind::RemoteFailure: return "remote_failure";
	case ErrorKind::Timeout: return "timeout";
	case ErrorKind::AlreadyInFlight: return "already_in_flight";
	case ErrorKind::Internal: return "internal";
	}
	return "unknown";
}

}
