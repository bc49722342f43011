#ifndef POOL_CONFIG_HPP
#define POOL_CONFIG_HPP

#include"Bitcoin/Amount.hpp"
#include"Bitcoin/Network.hpp"
#include<cstddef>
#include<cstdint>
#include<vector>

namespace Pool {

/** struct Pool::Config
 *
 * @brief the parameters every transaction in the
 * pool is derived from.
 *
 * @desc Passed by value to the tree builder,
 * the resolver and settlement; changing any
 * field changes every commitment in the tree.
 */
struct Config {
	Bitcoin::Network network;
	/* N  */
	std::size_t users;
	/* S  */
	Bitcoin::Amount amount_per_user;
	/* F, paid both as the transaction fee and to
	 * the fee anchor at every step.  */
	Bitcoin::Amount fee;
	Bitcoin::Amount dust;
	std::vector<std::uint8_t> fee_anchor_spk;
	std::uint32_t tx_version;
	std::uint32_t lock_time;
	std::uint32_t sequence;

	/* Beyond this the 2^N node count gets silly.  */
	static constexpr std::size_t max_users = 16;

	Config();

	/* Throws `Pool::ConfigError`.  */
	void validate() const;

	/* Deposited into the pool in total.  */
	Bitcoin::Amount total() const;
	/* Value of a node once `exited` users have left.  */
	Bitcoin::Amount node_value(std::size_t exited) const;
	/* What each user receives on exit.  */
	Bitcoin::Amount payout() const;
	/* Paid to the last remaining user.  */
	Bitcoin::Amount terminal_residual() const;
};

/* Pay-to-anchor, spendable by anyone for CPFP.  */
std::vector<std::uint8_t> p2a_script();

}

#endif /* !defined(POOL_CONFIG_HPP) */
