#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

#include<memory>

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 {
namespace Detail {

/* The struct definition is hidden inside libsecp256k1,
 * so it cannot be instantiated directly; a shared
 * pointer hides the deleter type as well.
 */
extern std::shared_ptr<secp256k1_context_struct> const context;

}
}

#endif /* SECP256K1_DETAIL_CONTEXT_HPP */
