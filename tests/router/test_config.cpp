#undef NDEBUG
#include"Router/Config.hpp"
#include"Router/Error.hpp"
#include<algorithm>
#include<assert.h>
#include<sstream>

namespace {

bool rejects(std::string const& name, std::string const& value) {
	auto c = Router::Config();
	try {
		c.set(name, value);
		return false;
	} catch (Router::ConfigError const&) {
		return true;
	}
}

}

int main() {
	/* Defaults.  */
	{
		auto c = Router::Config();
		assert(c.risk_factor() == 15);
		assert(c.attempt_cost_msat() == 100);
		assert(c.max_attempts() == 16);
		assert(c.default_final_cltv() == 18);
		assert(c.send_to_route_timeout() == 60);
		assert(c.log_level() == Router::Info);
	}

	/* Setting each option.  */
	{
		auto c = Router::Config();
		c.set("router-risk-factor", "0.5");
		c.set("router-attempt-cost-msat", "0");
		c.set("router-max-attempts", "3");
		c.set("router-default-final-cltv", "40");
		c.set("router-send-to-route-timeout", "2.5");
		c.set("router-log-level", "debug");
		assert(c.risk_factor() == 0.5);
		assert(c.attempt_cost_msat() == 0);
		assert(c.max_attempts() == 3);
		assert(c.default_final_cltv() == 40);
		assert(c.send_to_route_timeout() == 2.5);
		assert(c.log_level() == Router::Debug);
	}

	/* Bad values.  */
	assert(rejects("router-nonexistent", "1"));
	assert(rejects("router-risk-factor", "-1"));
	assert(rejects("router-risk-factor", "1.5x"));
	assert(rejects("router-risk-factor", "nan"));
	assert(rejects("router-risk-factor", ""));
	assert(rejects("router-attempt-cost-msat", "-5"));
	assert(rejects("router-attempt-cost-msat", "99999999999"));
	assert(rejects("router-max-attempts", "0"));
	assert(rejects("router-default-final-cltv", "65536"));
	assert(rejects("router-send-to-route-timeout", "0"));
	assert(rejects("router-log-level", "loud"));

	/* Files.  */
	{
		auto c = Router::Config();
		auto is = std::istringstream(
			"# comment\n"
			"\n"
			"  router-max-attempts = 5  \n"
			"router-log-level=warn\n"
		);
		c.load(is);
		assert(c.max_attempts() == 5);
		assert(c.log_level() == Router::Warn);
		/* Untouched.  */
		assert(c.default_final_cltv() == 18);
	}
	{
		auto c = Router::Config();
		auto is = std::istringstream("router-max-attempts 5\n");
		auto flag = false;
		try {
			c.load(is);
		} catch (Router::ConfigError const&) {
			flag = true;
		}
		assert(flag);
	}

	/* Every listed name is settable.  */
	{
		auto const& names = Router::Config::option_names();
		assert(names.size() == 6);
		assert(std::find(names.begin(), names.end(), "router-log-level") != names.end());
	}

	/* Log level names.  */
	{
		auto l = Router::LogLevel();
		assert(Router::log_level_from_name(l, "trace") && l == Router::Trace);
		assert(Router::log_level_from_name(l, "error") && l == Router::Error);
		assert(!Router::log_level_from_name(l, "Error"));
		assert(Router::log_level_name(Router::Warn) == "warn");
	}

	return 0;
}
