#ifndef POOL_EXIT_TX_HPP
#define POOL_EXIT_TX_HPP

#include<cstdint>
#include<vector>

namespace Bitcoin { class Amount; }
namespace Bitcoin { struct OutPoint; }
namespace Bitcoin { struct Tx; }
namespace Pool { struct Config; }

namespace Pool {

/** Pool::exit_tx
 *
 * @brief the transaction that spends a node of
 * the given value, letting one user exit.
 *
 * @desc Outputs are, in order: the exiter's
 * share less the fee, the fee anchor, and the
 * rest to `rest_spk` (the next node, or the
 * last user).
 * The tree builder and the resolver both build
 * through here, so the two cannot drift apart.
 */
Bitcoin::Tx exit_tx( Pool::Config const& config
		   , Bitcoin::Amount value
		   , std::vector<std::uint8_t> const& exiter_spk
		   , std::vector<std::uint8_t> const& rest_spk
		   , Bitcoin::OutPoint const& prevout
		   );

}

#endif /* !defined(POOL_EXIT_TX_HPP) */
