#ifndef SECP256K1_PUBKEY_HPP
#define SECP256K1_PUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Ln { class NodeId; }
namespace Secp256k1 { class PubKey; }
namespace Sha256 { class Hash; }

std::ostream& operator<<(std::ostream&, Secp256k1::PubKey const&);

namespace Secp256k1 {

/* Thrown in case of being fed an invalid public key.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey() : Util::BacktraceException<std::invalid_argument>("Invalid public key.") { }
};
/* Thrown if no public key can be recovered from a
 * signature.  */
class InvalidSignature : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidSignature() : Util::BacktraceException<std::invalid_argument>("Invalid signature.") { }
};

/** class Secp256k1::PubKey
 *
 * @brief a point on the secp256k1 curve, i.e. a
 * node's public key.
 */
class PubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	PubKey();

public:
	/* Load public key from a hex-encoded string.  */
	explicit PubKey(std::string const&);
	/* Create hex-encoded string.  */
	explicit operator std::string() const;

	/* Node IDs are compressed public keys.  */
	explicit PubKey(Ln::NodeId const&);
	Ln::NodeId to_node_id() const;

	PubKey(PubKey const&);
	PubKey(PubKey&&);
	~PubKey();

	PubKey& operator=(PubKey const& o) {
		auto tmp = PubKey(o);
		tmp.pimpl.swap(pimpl);
		return *this;
	}
	PubKey& operator=(PubKey&& o) {
		auto tmp = PubKey(std::move(o));
		tmp.pimpl.swap(pimpl);
		return *this;
	}

	bool operator==(PubKey const&) const;
	bool operator!=(PubKey const& o) const {
		return !(*this == o);
	}

	friend std::ostream& ::operator<<(std::ostream&, PubKey const&);

	static PubKey from_buffer(std::uint8_t const buffer[33]);
	void to_buffer(std::uint8_t buffer[33]) const;

	/** Secp256k1::PubKey::recover
	 *
	 * @brief recover the public key that produced a
	 * compact ECDSA signature over the given message
	 * hash.
	 *
	 * @desc `recid` is the recovery id (0 to 3).
	 * Throws InvalidSignature if nothing can be
	 * recovered.
	 */
	static PubKey recover( Sha256::Hash const& msg
			     , std::uint8_t const sig[64]
			     , int recid
			     );
};

}

#endif /* SECP256K1_PUBKEY_HPP */
