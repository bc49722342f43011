#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 { namespace Detail {

/** Secp256k1::Detail::context
 *
 * @brief the library context shared by every
 * key operation in this process.
 *
 * @desc Created on first use and never
 * destroyed.
 * Only public-key arithmetic is done with it,
 * so it carries no secrets and needs no
 * randomization.
 * Illegal arguments detected inside the library
 * come back out as `std::invalid_argument`.
 */
secp256k1_context_struct* context();

}}

#endif /* !defined(SECP256K1_DETAIL_CONTEXT_HPP) */
