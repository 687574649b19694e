#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** Util::Bech32::decode
 *
 * @brief decode a bech32 string into its human-readable
 * part and its 5-bit data words, excluding the checksum.
 *
 * @return true if decoding succeeded and the checksum
 * is valid.
 *
 * @desc No length limit is imposed, since BOLT-11
 * payment requests routinely exceed the 90-character
 * limit of segwit addresses.
 * Mixed-case strings are rejected.
 */
bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& words
	   , std::string const& bech32
	   );

/** Util::Bech32::encode
 *
 * @brief encode the given human-readable part and
 * 5-bit data words, appending the checksum.
 */
std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& words
		  );

/** Util::Bech32::words_to_bytes
 *
 * @brief pack 5-bit words into bytes, most significant
 * bit first, padding the final byte with 0 bits.
 */
template<typename It, typename OIt>
OIt words_to_bytes(It b, It e, OIt oit) {
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (; b != e; ++b) {
		acc = (acc << 5) | (std::uint32_t(*b) & 0x1F);
		bits += 5;
		while (bits >= 8) {
			bits -= 8;
			*oit = std::uint8_t((acc >> bits) & 0xFF);
			++oit;
		}
	}
	if (bits > 0) {
		*oit = std::uint8_t((acc << (8 - bits)) & 0xFF);
		++oit;
	}
	return oit;
}

/** Util::Bech32::bytes_to_words
 *
 * @brief unpack bytes into 5-bit words, padding the
 * final word with 0 bits.
 */
template<typename It, typename OIt>
OIt bytes_to_words(It b, It e, OIt oit) {
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (; b != e; ++b) {
		acc = (acc << 8) | std::uint32_t(std::uint8_t(*b));
		bits += 8;
		while (bits >= 5) {
			bits -= 5;
			*oit = std::uint8_t((acc >> bits) & 0x1F);
			++oit;
		}
	}
	if (bits > 0) {
		*oit = std::uint8_t((acc << (5 - bits)) & 0x1F);
		++oit;
	}
	return oit;
}

}}

#endif /* !defined(UTIL_BECH32_HPP) */
