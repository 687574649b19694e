#ifndef ROUTER_CONFIG_HPP
#define ROUTER_CONFIG_HPP

#include"Router/log.hpp"
#include<cstdint>
#include<iostream>
#include<string>
#include<vector>

namespace Router {

/** class Router::Config
 *
 * @brief engine settings, each with a default and
 * settable by option name.
 *
 * @desc Options:
 *
 * - `router-risk-factor`: weight of time-lock risk
 *   in route cost, per billion of amount times CLTV
 *   delta.
 * - `router-attempt-cost-msat`: fixed cost added to
 *   the route weight per hop.
 * - `router-max-attempts`: most attempts one payment
 *   may make.
 * - `router-default-final-cltv`: final CLTV delta if
 *   the payment request does not give one.
 * - `router-send-to-route-timeout`: seconds allowed
 *   for one SendToRoute.
 * - `router-log-level`: least severe level logged.
 */
class Config {
private:
	double risk_factor_;
	std::uint64_t attempt_cost_msat_;
	std::uint32_t max_attempts_;
	std::uint32_t default_final_cltv_;
	double send_to_route_timeout_;
	Router::LogLevel log_level_;

public:
	Config();

	double risk_factor() const { return risk_factor_; }
	std::uint64_t attempt_cost_msat() const { return attempt_cost_msat_; }
	std::uint32_t max_attempts() const { return max_attempts_; }
	std::uint32_t default_final_cltv() const { return default_final_cltv_; }
	double send_to_route_timeout() const { return send_to_route_timeout_; }
	Router::LogLevel log_level() const { return log_level_; }

	/** Router::Config::set
	 *
	 * @brief sets the named option from its string
	 * form. Throws Router::ConfigError for unknown
	 * names and malformed or out-of-range values.
	 */
	void set(std::string const& name, std::string const& value);

	/** Router::Config::load
	 *
	 * @brief reads `name=value` lines.
	 * Blank lines and lines starting with `#` are
	 * ignored; whitespace around names and values is
	 * trimmed.
	 */
	void load(std::istream&);

	/* Names of all options.  */
	static std::vector<std::string> const& option_names();
};

}

#endif /* !defined(ROUTER_CONFIG_HPP) */
