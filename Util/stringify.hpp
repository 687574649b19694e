#ifndef UTIL_STRINGIFY_HPP
#define UTIL_STRINGIFY_HPP

#include<sstream>
#include<string>

namespace Util {

/* Text of a value as its operator<< prints it;
 * used to put routes, amounts and counts into log
 * and error messages.  */
template<typename a>
std::string stringify(a const& v) {
	auto os = std::ostringstream();
	os << v;
	return os.str();
}

}

#endif /* !defined(UTIL_STRINGIFY_HPP) */
