#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 { namespace Detail {

/* The process-wide libsecp256k1 context, created and
 * blinded on first use.  API misuse throws
 * std::invalid_argument out of the failing call.
 */
secp256k1_context_struct* context();

}}

#endif /* !defined(SECP256K1_DETAIL_CONTEXT_HPP) */
