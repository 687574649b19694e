#include"Ln/ChannelUpdate.hpp"
#include"Ln/WireError.hpp"
#include"Ln/be.hpp"
#include<iterator>
#include<sstream>

namespace {

template<std::size_t N>
void write_bytes(std::ostream& os, std::array<std::uint8_t, N> const& a) {
	for (auto b : a)
		os.put(char(b));
}
template<std::size_t N>
void read_bytes(std::istream& is, std::array<std::uint8_t, N>& a) {
	for (auto& b : a) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof()) {
			is.setstate(std::ios_base::failbit);
			return;
		}
		b = std::uint8_t(c);
	}
}

}

namespace Ln {

ChannelUpdate::ChannelUpdate()
	: signature()
	, chain_hash()
	, chan_id(nullptr)
	, timestamp(0)
	, message_flags(0)
	, channel_flags(0)
	, time_lock_delta(0)
	, htlc_minimum_msat()
	, base_fee(0)
	, fee_rate(0)
	, htlc_maximum_msat()
	, extra_opaque_data()
	{ }

bool ChannelUpdate::operator==(ChannelUpdate const& o) const {
	return signature == o.signature
	    && chain_hash == o.chain_hash
	    && chan_id == o.chan_id
	    && timestamp == o.timestamp
	    && message_flags == o.message_flags
	    && channel_flags == o.channel_flags
	    && time_lock_delta == o.time_lock_delta
	    && htlc_minimum_msat == o.htlc_minimum_msat
	    && base_fee == o.base_fee
	    && fee_rate == o.fee_rate
	    && ( !has_htlc_maximum()
	      || htlc_maximum_msat == o.htlc_maximum_msat
	       )
	    && extra_opaque_data == o.extra_opaque_data
	     ;
}

std::ostream& operator<<(std::ostream& os, ChannelUpdate const& u) {
	write_bytes(os, u.signature);
	write_bytes(os, u.chain_hash);
	os << Ln::be(u.chan_id.to_u64())
	   << Ln::be(u.timestamp)
	    ;
	os.put(char(u.message_flags));
	os.put(char(u.channel_flags));
	os << Ln::be(u.time_lock_delta)
	   << Ln::be(u.htlc_minimum_msat)
	   << Ln::be(u.base_fee)
	   << Ln::be(u.fee_rate)
	    ;
	if (u.has_htlc_maximum())
		os << Ln::be(u.htlc_maximum_msat);
	for (auto b : u.extra_opaque_data)
		os.put(char(b));
	return os;
}

std::istream& operator>>(std::istream& is, ChannelUpdate& u) {
	read_bytes(is, u.signature);
	read_bytes(is, u.chain_hash);
	auto scid = std::uint64_t();
	is >> Ln::be(scid)
	   >> Ln::be(u.timestamp)
	    ;
	u.chan_id = Ln::Scid::from_u64(scid);
	auto mflags = is.get();
	auto cflags = is.get();
	if (cflags == std::char_traits<char>::eof()) {
		is.setstate(std::ios_base::failbit);
		return is;
	}
	u.message_flags = std::uint8_t(mflags);
	u.channel_flags = std::uint8_t(cflags);
	is >> Ln::be(u.time_lock_delta)
	   >> Ln::be(u.htlc_minimum_msat)
	   >> Ln::be(u.base_fee)
	   >> Ln::be(u.fee_rate)
	    ;
	if (u.has_htlc_maximum())
		is >> Ln::be(u.htlc_maximum_msat);
	if (!is)
		return is;
	u.extra_opaque_data.clear();
	for (auto c = is.get(); c != std::char_traits<char>::eof(); c = is.get())
		u.extra_opaque_data.push_back(std::uint8_t(c));
	/* Reaching the end of the opaque data is expected.  */
	is.clear(std::ios_base::eofbit);
	return is;
}

std::vector<std::uint8_t> ChannelUpdate::serialize() const {
	auto os = std::ostringstream();
	os << *this;
	auto s = os.str();
	return std::vector<std::uint8_t>(s.begin(), s.end());
}

ChannelUpdate ChannelUpdate::parse(std::vector<std::uint8_t> const& data) {
	auto is = std::istringstream(std::string(data.begin(), data.end()));
	auto ret = ChannelUpdate();
	is >> ret;
	if (is.fail())
		throw WireError("channel_update truncated");
	return ret;
}

}
