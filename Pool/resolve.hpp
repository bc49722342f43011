#ifndef POOL_RESOLVE_HPP
#define POOL_RESOLVE_HPP

#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include"Pool/Path.hpp"
#include<cstddef>
#include<memory>
#include<vector>

namespace Pool { struct Config; }
namespace Pool { struct Participant; }
namespace Pool { class Tree; }

namespace Pool {

struct Resolution {
	/* Fully witnessed, ready to broadcast.  */
	Bitcoin::Tx tx;
	/* The exit history after this step.  */
	Path next_path;
	/* Where the pool sits after this step; null
	 * once the last two users are paid out.  */
	std::unique_ptr<Bitcoin::OutPoint> continuation;
};

/** Pool::resolve
 *
 * @brief rebuilds the committed transaction that
 * lets `exiter` leave the pool output `outpoint`,
 * given the exits so far in `path`.
 *
 * @desc Throws `Pool::ResolveError` for an
 * unknown or repeating path, or an exiter who
 * is out of range or already gone.
 * Throws `Pool::CommitmentMismatch` if the
 * rebuilt transaction does not match its leaf,
 * e.g. because `config` differs from the one
 * the tree was built with.
 */
Resolution resolve( Tree const& tree
		  , std::vector<Participant> const& participants
		  , Config const& config
		  , Bitcoin::OutPoint const& outpoint
		  , Path const& path
		  , std::size_t exiter
		  );

}

#endif /* !defined(POOL_RESOLVE_HPP) */
