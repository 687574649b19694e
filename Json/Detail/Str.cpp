#include"Json/Detail/Str.hpp"
#include<iomanip>
#include<sstream>

namespace Json { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	std::ostringstream os;
	for (auto c : s) {
		switch (c) {
		case '\"': os << "\\\""; break;
		case '\\': os << "\\\\"; break;
		case '\b': os << "\\b"; break;
		case '\f': os << "\\f"; break;
		case '\n': os << "\\n"; break;
		case '\r': os << "\\r"; break;
		case '\t': os << "\\t"; break;
		default:
			/* Bytes of UTF-8 sequences pass through.  */
			if ((unsigned char) c < 32) {
				os << "\\u00";
				os << std::hex << std::setfill('0') << std::setw(2);
				os << ((unsigned int) (unsigned char) c);
				os << std::dec;
			} else {
				os << c;
			}
			break;
		}
	}
	return os.str();
}

}}}
