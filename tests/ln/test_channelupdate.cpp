#undef NDEBUG
#include"Ln/ChannelUpdate.hpp"
#include"Ln/WireError.hpp"
#include"Ln/be.hpp"
#include<assert.h>
#include<cstdint>
#include<sstream>
#include<string>
#include<vector>

namespace {

Ln::ChannelUpdate sample() {
	auto u = Ln::ChannelUpdate();
	for (auto i = 0; i < 64; ++i)
		u.signature[i] = std::uint8_t(i);
	for (auto i = 0; i < 32; ++i)
		u.chain_hash[i] = std::uint8_t(0xF0 + (i % 16));
	u.chan_id = Ln::Scid::make(700000, 12, 1);
	u.timestamp = 1600000000;
	u.message_flags = 0x01;
	u.channel_flags = 0x01;
	u.time_lock_delta = 40;
	u.htlc_minimum_msat = Ln::Amount::msat(1000);
	u.base_fee = 1000;
	u.fee_rate = 100;
	u.htlc_maximum_msat = Ln::Amount::sat(1000000);
	return u;
}

}

/* Encoders living in a namespace with stream operators
 * of their own still reach the big-endian ones.  */
namespace Wire {

struct Marker { };
std::ostream& operator<<(std::ostream& os, Marker) {
	return os.put('!');
}

std::string encode( std::uint16_t a
		  , std::uint32_t b
		  , Ln::Amount c
		  ) {
	auto os = std::ostringstream();
	os << Ln::be(a) << Ln::be(b) << Ln::be(c) << Marker();
	return os.str();
}

bool decode( std::string const& s
	   , std::uint16_t& a
	   , std::uint32_t& b
	   , Ln::Amount& c
	   ) {
	auto is = std::istringstream(s);
	is >> Ln::be(a) >> Ln::be(b) >> Ln::be(c);
	return bool(is);
}

}

int main() {
	/* Big-endian helpers.  */
	{
		auto s = Wire::encode(0x0102, 0x03040506, Ln::Amount::msat(0x0708));
		assert(s.size() == 2 + 4 + 8 + 1);
		assert(s[0] == 0x01);
		assert(s[1] == 0x02);
		assert(s[2] == 0x03);
		assert(s[5] == 0x06);
		assert(s[12] == 0x07);
		assert(s[13] == 0x08);
		assert(s[14] == '!');

		auto a = std::uint16_t();
		auto b = std::uint32_t();
		auto c = Ln::Amount();
		assert(Wire::decode(s, a, b, c));
		assert(a == 0x0102);
		assert(b == 0x03040506);
		assert(c == Ln::Amount::msat(0x0708));
		/* Short input fails.  */
		assert(!Wire::decode(s.substr(0, 9), a, b, c));
		assert(c == Ln::Amount::msat(0x0708));
	}

	/* Layout.  */
	{
		auto u = sample();
		auto data = u.serialize();
		/* 64 + 32 + 8 + 4 + 1 + 1 + 2 + 8 + 4 + 4 + 8 */
		assert(data.size() == 136);
		/* Scid, big-endian, right after the chain hash.  */
		assert(data[96] == 0x0A);
		assert(data[97] == 0xAE);
		assert(data[98] == 0x60);
		assert(data[99] == 0x00);
		assert(data[101] == 12);
		assert(data[103] == 1);
		/* Flags.  */
		assert(data[108] == 0x01);
		assert(data[109] == 0x01);
		/* cltv_expiry_delta.  */
		assert(data[110] == 0x00);
		assert(data[111] == 40);

		auto p = Ln::ChannelUpdate::parse(data);
		assert(p == u);
		assert(p.direction() == 1);
		assert(!p.disabled());
		assert(p.has_htlc_maximum());
	}

	/* Without htlc_maximum_msat.  */
	{
		auto u = sample();
		u.message_flags = 0;
		u.channel_flags = 0x02;
		auto data = u.serialize();
		assert(data.size() == 128);
		auto p = Ln::ChannelUpdate::parse(data);
		assert(p == u);
		assert(p.direction() == 0);
		assert(p.disabled());
		assert(!p.has_htlc_maximum());
	}

	/* Unknown trailing fields are kept verbatim.  */
	{
		auto u = sample();
		u.extra_opaque_data = {0xde, 0xad, 0x00, 0xbe, 0xef};
		auto data = u.serialize();
		assert(data.size() == 141);
		auto p = Ln::ChannelUpdate::parse(data);
		assert(p.extra_opaque_data == u.extra_opaque_data);
		assert(p.serialize() == data);
	}

	/* Truncation.  */
	{
		auto data = sample().serialize();
		for (auto cut : {std::size_t(0), std::size_t(50), std::size_t(100), std::size_t(130)}) {
			auto shorter = std::vector<std::uint8_t>(data.begin(), data.begin() + cut);
			auto flag = false;
			try {
				(void) Ln::ChannelUpdate::parse(shorter);
			} catch (Ln::WireError const&) {
				flag = true;
			}
			assert(flag);
		}
	}

	/* Fees.  */
	{
		auto u = sample();
		assert(u.fee(Ln::Amount::msat(1000000)) == Ln::Amount::msat(1100));
		assert(u.fee(Ln::Amount()) == Ln::Amount::msat(1000));
		assert(u.accepts(Ln::Amount::msat(1000)));
		assert(!u.accepts(Ln::Amount::msat(999)));
		assert(!u.accepts(Ln::Amount::sat(1000001)));
		u.message_flags = 0;
		assert(u.accepts(Ln::Amount::sat(1000001)));
	}

	return 0;
}
