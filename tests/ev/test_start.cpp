#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<functional>
#include<sstream>
#include<stdexcept>
#include<string>

namespace {

bool contains(std::string const& s, std::string const& part) {
	return s.find(part) != std::string::npos;
}

}

int main() {
	/* Exit code of the main action.  */
	{
		auto diag = std::ostringstream();
		auto code = Ev::start(Ev::yield().then([]() {
			return Ev::lift(7);
		}), diag);
		assert(code == 7);
		assert(diag.str() == "");
	}

	/* Unhandled exceptions are reported.  */
	{
		auto diag = std::ostringstream();
		auto code = Ev::start(Ev::lift().then([]() {
			throw std::runtime_error("no route to anywhere");
			return Ev::lift(0);
		}), diag);
		assert(code == 254);
		assert(contains(diag.str(), "unhandled exception: no route to anywhere"));
	}

	/* An action nothing will ever resume.  */
	{
		typedef std::function<void(int)> PassF;
		typedef std::function<void(std::exception_ptr)> FailF;
		auto diag = std::ostringstream();
		auto code = Ev::start(Ev::Io<int>([](PassF, FailF) { }), diag);
		assert(code == 253);
		assert(contains(diag.str(), "never completed"));
	}

	/* The loop can be started again afterwards.  */
	assert(Ev::start(Ev::lift(0)) == 0);

	return 0;
}
