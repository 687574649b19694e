#ifndef LN_WIREERROR_HPP
#define LN_WIREERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Ln {

/** struct Ln::WireError
 *
 * @brief thrown when a Lightning Network wire message
 * cannot be encoded or decoded.
 */
struct WireError : public Util::BacktraceException<std::runtime_error> {
	explicit
	WireError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Ln wire: " + msg
		  ) { }
};

}

#endif /* !defined(LN_WIREERROR_HPP) */
