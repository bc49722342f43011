#include"Ctv/Template.hpp"
#include"Ctv/covenant_script.hpp"
#include"Pool/Config.hpp"
#include"Pool/Error.hpp"
#include"Pool/Participant.hpp"
#include"Pool/Tree.hpp"
#include"Pool/exit_tx.hpp"
#include"Pool/resolve.hpp"
#include"Util/make_unique.hpp"

namespace Pool {

Resolution resolve( Tree const& tree
		  , std::vector<Participant> const& participants
		  , Config const& config
		  , Bitcoin::OutPoint const& outpoint
		  , Path const& path
		  , std::size_t exiter
		  ) {
	if (participants.size() != tree.get_participants().size())
		throw ResolveError("participant list does not match the tree");

	auto node = tree.lookup(path);
	if (!node)
		throw ResolveError("no pool node after exits " + to_string(path));
	if (exiter >= participants.size())
		throw ResolveError("no such user " + std::to_string(exiter));
	if (contains(path, exiter))
		throw ResolveError( "user " + std::to_string(exiter)
				  + " already exited in " + to_string(path)
				  );
	auto leaf = node->leaf_for(exiter);
	if (!leaf)
		throw ResolveError( "no leaf for user " + std::to_string(exiter)
				  + " after " + to_string(path)
				  );

	auto const* rest_spk = &participants[leaf->other].scriptPubKey;
	if (!node->terminal()) {
		auto child = tree.lookup(with(path, exiter));
		if (!child)
			throw ResolveError( "missing child of " + to_string(path)
					  + " for user " + std::to_string(exiter)
					  );
		rest_spk = &child->taproot.scriptPubKey;
	}

	auto rv = Resolution();
	rv.tx = exit_tx( config, node->value
		       , participants[exiter].scriptPubKey
		       , *rest_spk
		       , outpoint
		       );
	rv.tx.inputs[0].witness.push_back(leaf->script);
	rv.tx.inputs[0].witness.push_back(leaf->control_block);

	auto committed = Ctv::covenant_commitment(leaf->script);
	auto actual = Ctv::template_hash(rv.tx, 0);
	if (committed != actual)
		throw CommitmentMismatch( "user " + std::to_string(exiter)
					+ " after " + to_string(path)
					+ ": leaf commits to " + std::string(committed)
					+ ", rebuilt transaction hashes to "
					+ std::string(actual)
					);

	rv.next_path = path;
	rv.next_path.push_back(exiter);
	if (!node->terminal())
		rv.continuation = Util::make_unique<Bitcoin::OutPoint>(
			rv.tx.txid(), 2
		);

	return rv;
}

}
