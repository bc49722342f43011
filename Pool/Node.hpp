#ifndef POOL_NODE_HPP
#define POOL_NODE_HPP

#include"Bitcoin/Amount.hpp"
#include"Bitcoin/Tx.hpp"
#include"Ctv/TaprootNode.hpp"
#include"Pool/Path.hpp"
#include"Sha256/Hash.hpp"
#include<cstddef>
#include<cstdint>
#include<vector>

namespace Pool {

/** struct Pool::Leaf
 *
 * @brief one way out of a node: `exiter` takes
 * their share and the rest moves on.
 *
 * @desc `tx` is the committed transaction with
 * a null prevout, since the covenant does not
 * commit to it.
 */
struct Leaf {
	std::size_t exiter;
	/* Terminal layer only: the user paid the
	 * remainder.  */
	std::size_t other;
	Bitcoin::Tx tx;
	Sha256::Hash commitment;
	std::vector<std::uint8_t> script;
	std::vector<std::uint8_t> control_block;

	Leaf() : exiter(0), other(0) { }
};

/** struct Pool::Node
 *
 * @brief one taproot output of the pool, keyed
 * by which users have already exited.
 *
 * @desc `leaves` has one entry per remaining
 * user, in ascending user order, and is in the
 * same order as the leaves compiled into
 * `taproot`.
 */
struct Node {
	/* Remaining users minus 2; 0 is the terminal
	 * layer.  */
	std::size_t depth;
	Path exited;
	Bitcoin::Amount value;
	std::vector<Leaf> leaves;
	Ctv::TaprootNode taproot;

	Node() : depth(0) { }

	bool terminal() const { return depth == 0; }

	/* Null if `u` has no leaf here.  */
	Leaf const* leaf_for(std::size_t u) const {
		for (auto const& l : leaves)
			if (l.exiter == u)
				return &l;
		return nullptr;
	}
};

}

#endif /* !defined(POOL_NODE_HPP) */
