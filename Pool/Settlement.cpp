#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Pool/Error.hpp"
#include"Pool/NodeIF.hpp"
#include"Pool/Settlement.hpp"
#include"Pool/Tree.hpp"
#include"Pool/resolve.hpp"
#include"Util/make_unique.hpp"

namespace Pool {

class Settlement::Impl {
private:
	Tree const& tree;
	NodeIF& node;

	Bitcoin::OutPoint current;
	Path path;
	bool done;

	/* One step at a time.  */
	Ev::Semaphore sem;

	Ev::Io<Bitcoin::TxId> core_step(std::size_t u) {
		return Ev::lift().then([this, u]() {
			if (done)
				throw ResolveError(
					"pool already paid out after "
					+ to_string(path)
				);
			auto res = std::make_shared<Resolution>(resolve(
				tree, tree.get_participants(), tree.get_config(),
				current, path, u
			));
			return node.broadcast(res->tx).then([this, res](Bitcoin::TxId txid) {
				auto expected = res->tx.txid();
				if (txid != expected)
					throw NodeError(
						"node reported txid " + std::string(txid)
						+ " for transaction "
						+ std::string(expected)
					);

				path = std::move(res->next_path);
				if (res->continuation) {
					current = *res->continuation;
				} else {
					current = Bitcoin::OutPoint(txid, 2);
					done = true;
				}
				return Ev::lift(txid);
			});
		});
	}

public:
	Impl( Tree const& tree_
	    , NodeIF& node_
	    , Bitcoin::OutPoint const& funding
	    ) : tree(tree_)
	      , node(node_)
	      , current(funding)
	      , path()
	      , done(false)
	      , sem(1)
	      { }

	Ev::Io<Bitcoin::TxId> step(std::size_t u) {
		return sem.run(core_step(u));
	}

	Path const& exited() const { return path; }
	Bitcoin::OutPoint const& outpoint() const { return current; }
	bool terminal() const { return done; }
};

Settlement::Settlement( Tree const& tree
		      , NodeIF& node
		      , Bitcoin::OutPoint const& funding
		      ) : pimpl(Util::make_unique<Impl>(tree, node, funding)) { }
Settlement::Settlement(Settlement&&) =default;
Settlement::~Settlement() =default;

Ev::Io<Bitcoin::TxId> Settlement::step(std::size_t u) {
	return pimpl->step(u);
}
Path const& Settlement::exited() const {
	return pimpl->exited();
}
Bitcoin::OutPoint const& Settlement::outpoint() const {
	return pimpl->outpoint();
}
bool Settlement::terminal() const {
	return pimpl->terminal();
}

}
