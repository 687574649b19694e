#include"Ln/NodeId.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<stdexcept>

namespace Ln {

NodeId::NodeId(std::string const& s) : raw() {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			std::string("Ln::NodeId: not node ID: ") + s
		);
	if (s[1] == '0')
		return;
	auto val = Util::Str::hexread(s);
	std::copy(val.begin(), val.end(), raw.begin());
}

bool NodeId::valid_string(std::string const& s) {
	if (s.size() != 66)
		return false;
	if (!Util::Str::ishex(s))
		return false;
	if (s[0] != '0')
		return false;
	if (s[1] == '2' || s[1] == '3')
		return true;
	return std::all_of( s.begin(), s.end()
			  , [](char c) { return c == '0'; }
			  );
}

NodeId NodeId::from_buffer(std::uint8_t const buf[33]) {
	auto ret = NodeId();
	if (buf[0] != 0)
		std::copy(buf, buf + 33, ret.raw.begin());
	return ret;
}
void NodeId::to_buffer(std::uint8_t buf[33]) const {
	std::copy(raw.begin(), raw.end(), buf);
}

NodeId::operator std::string() const {
	return Util::Str::hexdump(raw.data(), raw.size());
}

std::istream& operator>>(std::istream& is, NodeId& n) {
	auto tmp = std::string();
	is >> tmp;
	n = NodeId(tmp);
	return is;
}

std::ostream& operator<<(std::ostream& os, NodeId const& n) {
	return os << std::string(n);
}

}
