#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<secp256k1.h>
#include<stdexcept>
#include<string>

namespace {

/* libsecp256k1 calls these instead of returning
 * when an argument violates its API contract, e.g.
 * a null pointer; a malformed key or signature is
 * reported through return values instead.  */
void illegal_callback(char const* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("secp256k1 illegal argument: ") + msg
	);
}
void error_callback(char const* msg, void*) {
	throw Util::BacktraceException<std::logic_error>(
		std::string("secp256k1 internal error: ") + msg
	);
}

std::shared_ptr<secp256k1_context_struct> create_context() {
	/* Verification covers public key recovery;
	 * signing is only needed by tests that build
	 * payment requests.  */
	auto ctx = secp256k1_context_create( SECP256K1_CONTEXT_SIGN
					   | SECP256K1_CONTEXT_VERIFY
					   );
	auto rv = std::shared_ptr<secp256k1_context_struct>(
		ctx, &secp256k1_context_destroy
	);
	secp256k1_context_set_illegal_callback( rv.get()
					      , &illegal_callback
					      , nullptr
					      );
	secp256k1_context_set_error_callback( rv.get()
					    , &error_callback
					    , nullptr
					    );
	return rv;
}

}

namespace Secp256k1 { namespace Detail {

std::shared_ptr<secp256k1_context_struct> const context = create_context();

}}
