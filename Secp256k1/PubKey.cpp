#include<secp256k1.h>
#include<secp256k1_recovery.h>
#include<sstream>
#include<string>
#include<string.h>
#include<utility>
#include"Ln/NodeId.hpp"
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

using Secp256k1::Detail::context;

namespace Secp256k1 {

class PubKey::Impl {
public:
	secp256k1_pubkey key;

	Impl() { }
	explicit Impl(std::uint8_t const buffer[33]) {
		auto res = secp256k1_ec_pubkey_parse( context.get()
						    , &key
						    , buffer
						    , 33
						    );
		if (!res)
			throw InvalidPubKey();
	}
	Impl(Impl const& o) {
		key = o.key;
	}

	void to_buffer(std::uint8_t buffer[33]) const {
		size_t size = 33;
		auto res = secp256k1_ec_pubkey_serialize( context.get()
							, buffer
							, &size
							, &key
							, SECP256K1_EC_COMPRESSED
							);
		if (!res || size != 33)
			throw Util::BacktraceException<std::logic_error>(
				"Secp256k1::PubKey: serialize failed"
			);
	}

	bool equal(Impl const& o) const {
		std::uint8_t a[33];
		std::uint8_t b[33];
		to_buffer(a);
		o.to_buffer(b);
		/* Public keys are not secret.  */
		return 0 == memcmp(a, b, sizeof(a));
	}
};

PubKey::PubKey() : pimpl(Util::make_unique<Impl>()) { }

PubKey::PubKey(std::string const& s) {
	if (!Util::Str::ishex(s))
		throw InvalidPubKey();
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 33)
		throw InvalidPubKey();
	pimpl = Util::make_unique<Impl>(&buf[0]);
}
PubKey::operator std::string() const {
	std::uint8_t buf[33];
	to_buffer(buf);
	return Util::Str::hexdump(buf, sizeof(buf));
}

PubKey::PubKey(Ln::NodeId const& n) {
	if (!n)
		throw InvalidPubKey();
	std::uint8_t buf[33];
	n.to_buffer(buf);
	pimpl = Util::make_unique<Impl>(buf);
}
Ln::NodeId PubKey::to_node_id() const {
	std::uint8_t buf[33];
	to_buffer(buf);
	return Ln::NodeId::from_buffer(buf);
}

PubKey::PubKey(PubKey const& o)
	: pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
PubKey::PubKey(PubKey&& o)
	: pimpl(std::move(o.pimpl)) { }
PubKey::~PubKey() { }

bool PubKey::operator==(PubKey const& o) const {
	return pimpl->equal(*o.pimpl);
}

PubKey PubKey::from_buffer(std::uint8_t const buffer[33]) {
	auto ret = PubKey();
	ret.pimpl = Util::make_unique<Impl>(buffer);
	return ret;
}
void PubKey::to_buffer(std::uint8_t buffer[33]) const {
	pimpl->to_buffer(buffer);
}

PubKey PubKey::recover( Sha256::Hash const& msg
		      , std::uint8_t const sig[64]
		      , int recid
		      ) {
	if (recid < 0 || recid > 3)
		throw InvalidSignature();

	secp256k1_ecdsa_recoverable_signature rsig;
	auto res = secp256k1_ecdsa_recoverable_signature_parse_compact(
		context.get(), &rsig, sig, recid
	);
	if (!res)
		throw InvalidSignature();

	std::uint8_t hash[32];
	msg.to_buffer(hash);

	auto ret = PubKey();
	res = secp256k1_ecdsa_recover( context.get()
				     , &ret.pimpl->key
				     , &rsig
				     , hash
				     );
	if (!res)
		throw InvalidSignature();
	return ret;
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::PubKey const& pk) {
	return os << std::string(pk);
}
