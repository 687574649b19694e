#include"Ln/Failure.hpp"
#include"Util/Str.hpp"

namespace {

char const* const names[] =
{ "RESERVED"
, "UNKNOWN_PAYMENT_HASH"
, "INCORRECT_PAYMENT_AMOUNT"
, "FINAL_INCORRECT_CLTV_EXPIRY"
, "FINAL_INCORRECT_HTLC_AMOUNT"
, "FINAL_EXPIRY_TOO_SOON"
, "INVALID_REALM"
, "EXPIRY_TOO_SOON"
, "INVALID_ONION_VERSION"
, "INVALID_ONION_HMAC"
, "INVALID_ONION_KEY"
, "AMOUNT_BELOW_MINIMUM"
, "FEE_INSUFFICIENT"
, "INCORRECT_CLTV_EXPIRY"
, "CHANNEL_DISABLED"
, "TEMPORARY_CHANNEL_FAILURE"
, "REQUIRED_NODE_FEATURE_MISSING"
, "REQUIRED_CHANNEL_FEATURE_MISSING"
, "UNKNOWN_NEXT_PEER"
, "TEMPORARY_NODE_FAILURE"
, "PERMANENT_NODE_FAILURE"
, "PERMANENT_CHANNEL_FAILURE"
};

}

namespace Ln {

std::string failure_code_name(std::uint32_t code) {
	if (code < sizeof(names) / sizeof(names[0]))
		return names[code];
	return Util::Str::fmt("UNKNOWN(%u)", (unsigned) code);
}

}
