#ifndef POOL_SETTLEMENT_HPP
#define POOL_SETTLEMENT_HPP

#include"Pool/Path.hpp"
#include<cstddef>
#include<memory>

namespace Bitcoin { struct OutPoint; }
namespace Bitcoin { class TxId; }
namespace Ev { template<typename a> class Io; }
namespace Pool { class NodeIF; }
namespace Pool { class Tree; }

namespace Pool {

/** class Pool::Settlement
 *
 * @brief walks a funded pool down the tree, one
 * exiting user at a time.
 *
 * @desc Starts at the root, with the pool held
 * in the funding outpoint.
 * After N - 1 successful steps every user has
 * been paid and the settlement is terminal.
 *
 * Steps are serialized: a step issued while
 * another is in flight waits for it, then
 * resolves against whatever state it left.
 *
 * The tree and node must outlive this object.
 */
class Settlement {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Settlement() =delete;
	Settlement(Settlement const&) =delete;

	Settlement( Tree const& tree
		  , NodeIF& node
		  , Bitcoin::OutPoint const& funding
		  );
	Settlement(Settlement&&);
	~Settlement();

	/** Pool::Settlement::step
	 *
	 * @brief broadcasts the transaction letting
	 * user `u` exit, and advances once the node
	 * accepts it.
	 *
	 * @desc If the node rejects it, the state is
	 * unchanged and the `Pool::NodeError` is
	 * rethrown, so the step can be retried.
	 * Throws `Pool::ResolveError` after the last
	 * step, or if `u` cannot exit now.
	 */
	Ev::Io<Bitcoin::TxId> step(std::size_t u);

	/* Exits so far, in order.  */
	Path const& exited() const;
	/* Current pool outpoint; the last step's
	 * transaction once terminal.  */
	Bitcoin::OutPoint const& outpoint() const;
	bool terminal() const;
};

}

#endif /* !defined(POOL_SETTLEMENT_HPP) */
