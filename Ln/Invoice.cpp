#include"Ln/Invoice.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sha256/fun.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>
#include<iterator>
#include<vector>

namespace {

/* Bech32 values of the tagged field types.  */
auto const tag_p = std::uint8_t(1);
auto const tag_x = std::uint8_t(6);
auto const tag_d = std::uint8_t(13);
auto const tag_n = std::uint8_t(19);
auto const tag_h = std::uint8_t(23);
auto const tag_c = std::uint8_t(24);

/* 65 bytes of signature plus recovery id.  */
auto const signature_words = std::size_t(104);
/* 35-bit timestamp.  */
auto const timestamp_words = std::size_t(7);

auto const default_expiry = std::uint64_t(3600);

std::uint64_t
read_uint(std::vector<std::uint8_t>::const_iterator b, std::size_t len) {
	if (len * 5 > 64)
		throw Ln::InvoiceError("integer field too long");
	auto rv = std::uint64_t(0);
	for (auto i = std::size_t(0); i < len; ++i, ++b)
		rv = (rv << 5) | std::uint64_t(*b);
	return rv;
}

/* Converts words to bytes, dropping the padding
 * bits at the end.  */
std::vector<std::uint8_t>
read_bytes(std::vector<std::uint8_t>::const_iterator b, std::size_t len) {
	auto rv = std::vector<std::uint8_t>();
	Util::Bech32::words_to_bytes(b, b + len, std::back_inserter(rv));
	rv.resize((len * 5) / 8);
	return rv;
}

bool is_digit(char c) {
	return '0' <= c && c <= '9';
}

/* Parses the human-readable part, `ln` + currency +
 * optional amount.  */
void parse_hrp( std::string const& hrp
	      , std::string& currency
	      , bool& has_amount
	      , Ln::Amount& amount
	      ) {
	if (hrp.size() < 3 || hrp.substr(0, 2) != "ln")
		throw Ln::InvoiceError("not a lightning payment request");
	auto it = std::find_if(hrp.begin() + 2, hrp.end(), is_digit);
	currency = std::string(hrp.begin() + 2, it);
	if (currency.empty())
		throw Ln::InvoiceError("missing currency");
	if (it == hrp.end()) {
		has_amount = false;
		amount = Ln::Amount();
		return;
	}

	auto num = std::uint64_t(0);
	for (; it != hrp.end() && is_digit(*it); ++it) {
		auto nnum = num * 10 + std::uint64_t(*it - '0');
		if (nnum / 10 != num)
			throw Ln::InvoiceError("amount overflow");
		num = nnum;
	}

	/* Multipliers give the msat per unit of `num`;
	 * pico-bitcoin amounts are tenths of a msat.  */
	auto msat_per_unit = std::uint64_t(0);
	if (it == hrp.end()) {
		msat_per_unit = 100000000000ULL;
	} else {
		auto mult = *it;
		++it;
		if (it != hrp.end())
			throw Ln::InvoiceError("garbage after amount");
		switch (mult) {
		case 'm': msat_per_unit = 100000000ULL; break;
		case 'u': msat_per_unit = 100000ULL; break;
		case 'n': msat_per_unit = 100ULL; break;
		case 'p':
			if (num % 10 != 0)
				throw Ln::InvoiceError("sub-millisatoshi amount");
			has_amount = true;
			amount = Ln::Amount::msat(num / 10);
			return;
		default:
			throw Ln::InvoiceError("unknown amount multiplier");
		}
	}
	auto msat = num * msat_per_unit;
	if (num != 0 && msat / num != msat_per_unit)
		throw Ln::InvoiceError("amount overflow");
	has_amount = true;
	amount = Ln::Amount::msat(msat);
}

}

namespace Ln {

Invoice::Invoice()
	: currency()
	, has_amount(false)
	, amount()
	, timestamp(0)
	, payment_hash()
	, payee()
	, description()
	, has_description_hash(false)
	, description_hash()
	, expiry(default_expiry)
	, has_min_final_cltv_expiry(false)
	, min_final_cltv_expiry(0)
	{ }

Invoice::Invoice(std::string const& s_) : Invoice() {
	auto s = s_;
	auto lower = std::string();
	std::transform( s.begin(), s.end(), std::back_inserter(lower)
		      , [](char c) { return char(tolower(c)); }
		      );
	if (lower.substr(0, 10) == "lightning:")
		s = s.substr(10);

	auto hrp = std::string();
	auto words = std::vector<std::uint8_t>();
	if (!Util::Bech32::decode(hrp, words, s))
		throw InvoiceError("invalid bech32 or bad checksum");

	parse_hrp(hrp, currency, has_amount, amount);

	if (words.size() < timestamp_words + signature_words)
		throw InvoiceError("too short");

	auto data_end = words.cend() - signature_words;
	auto it = std::vector<std::uint8_t>::const_iterator(words.begin());
	timestamp = read_uint(it, timestamp_words);
	it += timestamp_words;

	auto have_payment_hash = false;
	auto have_payee = false;
	while (it != data_end) {
		if (data_end - it < 3)
			throw InvoiceError("truncated tagged field");
		auto type = *it;
		auto len = std::size_t(*(it + 1)) * 32 + std::size_t(*(it + 2));
		it += 3;
		if (std::size_t(data_end - it) < len)
			throw InvoiceError("truncated tagged field");

		/* Fields of unexpected length are skipped.  */
		if (type == tag_p && len == 52) {
			auto bytes = read_bytes(it, len);
			payment_hash.from_buffer(&bytes[0]);
			have_payment_hash = true;
		} else if (type == tag_n && len == 53) {
			auto bytes = read_bytes(it, len);
			payee = Ln::NodeId::from_buffer(&bytes[0]);
			have_payee = true;
		} else if (type == tag_h && len == 52) {
			auto bytes = read_bytes(it, len);
			description_hash.from_buffer(&bytes[0]);
			has_description_hash = true;
		} else if (type == tag_d) {
			auto bytes = read_bytes(it, len);
			description = std::string(bytes.begin(), bytes.end());
		} else if (type == tag_x) {
			expiry = read_uint(it, len);
		} else if (type == tag_c) {
			auto v = read_uint(it, len);
			if (v > 0xFFFFFFFF)
				throw InvoiceError("min_final_cltv_expiry too large");
			has_min_final_cltv_expiry = true;
			min_final_cltv_expiry = std::uint32_t(v);
		}
		it += len;
	}

	if (!have_payment_hash)
		throw InvoiceError("missing payment hash");

	/* Signed message is hrp followed by the data words
	 * packed into bytes.  */
	auto msg = std::vector<std::uint8_t>(hrp.begin(), hrp.end());
	Util::Bech32::words_to_bytes( words.cbegin(), data_end
				    , std::back_inserter(msg)
				    );
	auto sig = std::vector<std::uint8_t>();
	Util::Bech32::words_to_bytes( data_end, words.cend()
				    , std::back_inserter(sig)
				    );

	auto hash = Sha256::fun(msg);
	auto recovered = Ln::NodeId();
	try {
		auto pk = Secp256k1::PubKey::recover(hash, &sig[0], sig[64]);
		recovered = pk.to_node_id();
	} catch (Secp256k1::InvalidSignature const&) {
		throw InvoiceError("invalid signature");
	}
	if (have_payee && payee != recovered)
		throw InvoiceError("signature does not match payee");
	payee = recovered;
}

bool Invoice::valid_string(std::string const& s) {
	try {
		auto tmp = Invoice(s);
		return true;
	} catch (InvoiceError const&) {
		return false;
	}
}

}
