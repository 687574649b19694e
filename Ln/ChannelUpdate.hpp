#ifndef LN_CHANNELUPDATE_HPP
#define LN_CHANNELUPDATE_HPP

#include"Ln/Amount.hpp"
#include"Ln/Scid.hpp"
#include<array>
#include<cstdint>
#include<iostream>
#include<vector>

namespace Ln {

/** struct Ln::ChannelUpdate
 *
 * @brief the forwarding policy one endpoint of a
 * channel announces for its direction of the
 * channel.
 *
 * @desc `extra_opaque_data` holds trailing fields
 * this code does not understand; they are kept
 * byte-for-byte so that re-serializing an update
 * reproduces exactly what was signed.
 */
struct ChannelUpdate {
	std::array<std::uint8_t, 64> signature;
	std::array<std::uint8_t, 32> chain_hash;
	Ln::Scid chan_id;
	std::uint32_t timestamp;
	std::uint8_t message_flags;
	std::uint8_t channel_flags;
	std::uint16_t time_lock_delta;
	Ln::Amount htlc_minimum_msat;
	/* In msat.  */
	std::uint32_t base_fee;
	/* Parts per million.  */
	std::uint32_t fee_rate;
	/* Only meaningful if has_htlc_maximum().  */
	Ln::Amount htlc_maximum_msat;
	std::vector<std::uint8_t> extra_opaque_data;

	ChannelUpdate();

	/* 0 if announced by node_1 of the channel,
	 * 1 if by node_2.  */
	int direction() const {
		return channel_flags & 0x01;
	}
	bool disabled() const {
		return (channel_flags & 0x02) != 0;
	}
	bool has_htlc_maximum() const {
		return (message_flags & 0x01) != 0;
	}

	/* Fee charged to forward the given amount over
	 * this direction of the channel.  */
	Ln::Amount fee(Ln::Amount amount) const {
		return Ln::Amount::msat(base_fee) + amount.ppm(fee_rate);
	}
	/* Whether an HTLC of the given amount is within
	 * the announced limits.  */
	bool accepts(Ln::Amount amount) const {
		if (amount < htlc_minimum_msat)
			return false;
		if (has_htlc_maximum() && amount > htlc_maximum_msat)
			return false;
		return true;
	}

	/** Ln::ChannelUpdate::serialize
	 *
	 * @brief encodes the `channel_update` message
	 * body, without the message type.
	 */
	std::vector<std::uint8_t> serialize() const;
	/** Ln::ChannelUpdate::parse
	 *
	 * @brief decodes a `channel_update` message body.
	 * Throws Ln::WireError on truncated input.
	 */
	static
	ChannelUpdate parse(std::vector<std::uint8_t> const&);

	bool operator==(ChannelUpdate const&) const;
	bool operator!=(ChannelUpdate const& o) const {
		return !(*this == o);
	}
};

std::ostream& operator<<(std::ostream&, ChannelUpdate const&);
/* Consumes the rest of the stream as extra_opaque_data.  */
std::istream& operator>>(std::istream&, ChannelUpdate&);

}

#endif /* !defined(LN_CHANNELUPDATE_HPP) */
