#ifndef LN_FAILURE_HPP
#define LN_FAILURE_HPP

#include"Ln/Amount.hpp"
#include"Ln/ChannelUpdate.hpp"
#include"Ln/NodeId.hpp"
#include<array>
#include<cstdint>
#include<memory>
#include<string>

namespace Ln {

/** enum Ln::FailureCode
 *
 * @brief the onion failure codes a payment attempt
 * can fail with, numbered as on the RPC interface
 * (0 is reserved and never sent).
 */
enum class FailureCode : std::uint32_t
{ RESERVED = 0
, UNKNOWN_PAYMENT_HASH = 1
, INCORRECT_PAYMENT_AMOUNT = 2
, FINAL_INCORRECT_CLTV_EXPIRY = 3
, FINAL_INCORRECT_HTLC_AMOUNT = 4
, FINAL_EXPIRY_TOO_SOON = 5
, INVALID_REALM = 6
, EXPIRY_TOO_SOON = 7
, INVALID_ONION_VERSION = 8
, INVALID_ONION_HMAC = 9
, INVALID_ONION_KEY = 10
, AMOUNT_BELOW_MINIMUM = 11
, FEE_INSUFFICIENT = 12
, INCORRECT_CLTV_EXPIRY = 13
, CHANNEL_DISABLED = 14
, TEMPORARY_CHANNEL_FAILURE = 15
, REQUIRED_NODE_FEATURE_MISSING = 16
, REQUIRED_CHANNEL_FEATURE_MISSING = 17
, UNKNOWN_NEXT_PEER = 18
, TEMPORARY_NODE_FAILURE = 19
, PERMANENT_NODE_FAILURE = 20
, PERMANENT_CHANNEL_FAILURE = 21
};

/* Name of the code as on the RPC interface, or
 * "UNKNOWN(<n>)" for values outside the enum.  */
std::string failure_code_name(std::uint32_t code);
inline
std::string failure_code_name(FailureCode code) {
	return failure_code_name(std::uint32_t(code));
}

/** struct Ln::Failure
 *
 * @brief the failure a remote node reported for one
 * payment attempt.
 *
 * @desc `code` is the raw value received, which may
 * lie outside FailureCode.
 */
struct Failure {
	std::uint32_t code;
	Ln::NodeId failure_source_pubkey;
	/* Null if the failure carried no channel update.  */
	std::shared_ptr<Ln::ChannelUpdate const> channel_update;
	Ln::Amount htlc_msat;
	std::array<std::uint8_t, 32> onion_sha_256;
	std::uint32_t cltv_expiry;
	std::uint32_t flags;

	Failure()
		: code(0)
		, failure_source_pubkey()
		, channel_update()
		, htlc_msat()
		, onion_sha_256()
		, cltv_expiry(0)
		, flags(0)
		{ }
	Failure( FailureCode code_
	       , Ln::NodeId source
	       ) : Failure() {
		code = std::uint32_t(code_);
		failure_source_pubkey = std::move(source);
	}

	bool is(FailureCode c) const {
		return code == std::uint32_t(c);
	}
	std::string code_name() const {
		return failure_code_name(code);
	}
};

}

#endif /* !defined(LN_FAILURE_HPP) */
