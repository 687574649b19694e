#include"Router/Config.hpp"
#include"Router/Error.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<cmath>
#include<ctype.h>
#include<limits>
#include<locale>
#include<sstream>

namespace {

auto const default_risk_factor = double(15);
auto const default_attempt_cost_msat = std::uint64_t(100);
auto const default_max_attempts = std::uint32_t(16);
/* BOLT-11 default when the invoice has no `c` field.  */
auto const bolt11_final_cltv = std::uint32_t(18);
auto const default_send_to_route_timeout = double(60);
auto const default_log_level = Router::Info;

std::string trim(std::string const& s) {
	auto b = std::find_if( s.begin(), s.end()
			     , [](char c) { return !isspace((unsigned char) c); }
			     );
	auto e = std::find_if( s.rbegin(), s.rend()
			     , [](char c) { return !isspace((unsigned char) c); }
			     ).base();
	if (b >= e)
		return std::string();
	return std::string(b, e);
}

Router::ConfigError bad_value(std::string const& name, std::string const& value) {
	return Router::ConfigError(Util::Str::fmt(
		"Config: bad value for %s: '%s'", name.c_str(), value.c_str()
	));
}

std::uint64_t parse_uint( std::string const& name
			, std::string const& value
			, std::uint64_t min
			, std::uint64_t max
			) {
	if (value.empty() || value.size() > 20)
		throw bad_value(name, value);
	auto all_digits = std::all_of( value.begin(), value.end()
				     , [](char c) { return '0' <= c && c <= '9'; }
				     );
	if (!all_digits)
		throw bad_value(name, value);
	auto is = std::istringstream(value);
	auto rv = std::uint64_t();
	is >> rv;
	if (is.fail() || rv < min || rv > max)
		throw bad_value(name, value);
	return rv;
}

double parse_double( std::string const& name
		   , std::string const& value
		   ) {
	auto is = std::istringstream(value);
	is.imbue(std::locale("C"));
	auto rv = double();
	is >> rv;
	if (is.fail() || !is.eof() || std::isnan(rv) || std::isinf(rv))
		throw bad_value(name, value);
	return rv;
}

}

namespace Router {

Config::Config()
	: risk_factor_(default_risk_factor)
	, attempt_cost_msat_(default_attempt_cost_msat)
	, max_attempts_(default_max_attempts)
	, default_final_cltv_(bolt11_final_cltv)
	, send_to_route_timeout_(default_send_to_route_timeout)
	, log_level_(default_log_level)
	{ }

std::vector<std::string> const& Config::option_names() {
	static auto const names = std::vector<std::string>{
		"router-risk-factor",
		"router-attempt-cost-msat",
		"router-max-attempts",
		"router-default-final-cltv",
		"router-send-to-route-timeout",
		"router-log-level"
	};
	return names;
}

void Config::set(std::string const& name, std::string const& value) {
	if (name == "router-risk-factor") {
		auto v = parse_double(name, value);
		if (v < 0)
			throw bad_value(name, value);
		risk_factor_ = v;
	} else if (name == "router-attempt-cost-msat") {
		attempt_cost_msat_ = parse_uint( name, value
					       , 0
					       , std::numeric_limits<std::uint32_t>::max()
					       );
	} else if (name == "router-max-attempts") {
		max_attempts_ = std::uint32_t(parse_uint( name, value
							, 1
							, 1000000
							));
	} else if (name == "router-default-final-cltv") {
		default_final_cltv_ = std::uint32_t(parse_uint( name, value
							      , 1
							      , 0xFFFF
							      ));
	} else if (name == "router-send-to-route-timeout") {
		auto v = parse_double(name, value);
		if (!(v > 0))
			throw bad_value(name, value);
		send_to_route_timeout_ = v;
	} else if (name == "router-log-level") {
		auto l = Router::LogLevel();
		if (!log_level_from_name(l, value))
			throw bad_value(name, value);
		log_level_ = l;
	} else {
		throw ConfigError(Util::Str::fmt(
			"Config: unknown option: %s", name.c_str()
		));
	}
}

void Config::load(std::istream& is) {
	auto line = std::string();
	auto lineno = 0;
	while (std::getline(is, line)) {
		++lineno;
		auto t = trim(line);
		if (t.empty() || t[0] == '#')
			continue;
		auto eq = t.find('=');
		if (eq == std::string::npos)
			throw ConfigError(Util::Str::fmt(
				"Config: line %d: expected name=value",
				lineno
			));
		set(trim(t.substr(0, eq)), trim(t.substr(eq + 1)));
	}
}

}
