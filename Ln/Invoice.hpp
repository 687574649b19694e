#ifndef LN_INVOICE_HPP
#define LN_INVOICE_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Ln {

/* Thrown when a payment request cannot be decoded.  */
struct InvoiceError : public Util::BacktraceException<std::invalid_argument> {
	explicit
	InvoiceError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Ln::Invoice: " + msg
		  ) { }
};

/** class Ln::Invoice
 *
 * @brief a decoded BOLT-11 payment request.
 *
 * @desc Construction verifies the bech32 checksum and
 * the signature, and recovers the payee from the
 * signature.
 * Tagged fields this code does not use are skipped.
 */
class Invoice {
public:
	/* "bc", "tb", "bcrt", ...  */
	std::string currency;
	bool has_amount;
	Ln::Amount amount;
	/* Seconds since the epoch.  */
	std::uint64_t timestamp;
	Sha256::Hash payment_hash;
	Ln::NodeId payee;
	std::string description;
	bool has_description_hash;
	Sha256::Hash description_hash;
	/* Seconds after timestamp.  */
	std::uint64_t expiry;
	bool has_min_final_cltv_expiry;
	std::uint32_t min_final_cltv_expiry;

	Invoice();
	explicit
	Invoice(std::string const&);

	static
	bool valid_string(std::string const&);

	bool expired(double now) const {
		return now >= double(timestamp) + double(expiry);
	}
};

}

#endif /* !defined(LN_INVOICE_HPP) */
