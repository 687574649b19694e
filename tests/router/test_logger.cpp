#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Router/Mod/Logger.hpp"
#include"Router/log.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<sstream>
#include<string>
#include<vector>

namespace {

std::vector<std::string> lines(std::string const& s) {
	auto rv = std::vector<std::string>();
	auto is = std::istringstream(s);
	auto line = std::string();
	while (std::getline(is, line))
		rv.push_back(line);
	return rv;
}

}

int main() {
	S::Bus bus;
	auto os = std::ostringstream();
	Router::Mod::Logger logger(bus, os, Router::Info);

	auto code = Ev::lift().then([&]() {
		return Router::log(bus, Router::Debug, "hidden %d", 1);
	}).then([&]() {
		return Router::log(bus, Router::Info, "payment %s started", "abcd");
	}).then([&]() {
		return Router::log(bus, Router::Trace, "hidden too");
	}).then([&]() {
		return Router::log(bus, Router::Error, "quote \" and\nnewline");
	}).then([&]() {
		return Router::log(bus, Router::Warn, "%u attempts", 3u);
	}).then([&]() {
		/* Output is written from a separate greenthread.  */
		return Ev::yield(8);
	}).then([&]() {
		auto ls = lines(os.str());
		assert(ls.size() == 3);
		assert(ls[0] == "{\"level\": \"info\", \"message\": \"payment abcd started\"}");
		assert(ls[1] == "{\"level\": \"error\", \"message\": \"quote \\\" and\\nnewline\"}");
		assert(ls[2] == "{\"level\": \"warn\", \"message\": \"3 attempts\"}");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
