#include"Bitcoin/OutPoint.hpp"
#include"Ctv/Template.hpp"
#include"Ctv/covenant_script.hpp"
#include"Pool/Error.hpp"
#include"Pool/Tree.hpp"
#include"Pool/exit_tx.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Util/Str.hpp"

namespace {

/* Policy limit on a tapscript leaf.  */
auto constexpr max_script_size = std::size_t(10000);

/* All size-k subsets of 0..n-1, each sorted,
 * in lexicographic order.  */
void subsets( std::vector<Pool::Path>& out
	    , Pool::Path& current
	    , std::size_t next
	    , std::size_t n
	    , std::size_t k
	    ) {
	if (current.size() == k) {
		out.push_back(current);
		return;
	}
	for (auto i = next; i < n; ++i) {
		/* Not enough left to fill the subset.  */
		if (n - i < k - current.size())
			break;
		current.push_back(i);
		subsets(out, current, i + 1, n, k);
		current.pop_back();
	}
}
std::vector<Pool::Path> subsets(std::size_t n, std::size_t k) {
	auto rv = std::vector<Pool::Path>();
	auto current = Pool::Path();
	subsets(rv, current, 0, n, k);
	return rv;
}

}

namespace Pool {

Tree Tree::build( Config const& config
		, std::vector<Participant> const& participants
		) {
	config.validate();
	if (participants.size() != config.users)
		throw ConfigError(Util::Str::fmt(
			"expected %zu participants, got %zu"
			, config.users, participants.size()
		));
	for (auto i = std::size_t(0); i < participants.size(); ++i)
		if (participants[i].index != i)
			throw ConfigError(Util::Str::fmt(
				"participant at position %zu has index %zu"
				, i, participants[i].index
			));

	auto n = config.users;
	auto rv = Tree();
	rv.config = config;
	rv.participants = participants;
	rv.layers.resize(n - 1);

	/* Children first, so each parent can pay to
	 * its already-compiled children.  */
	for (auto depth = std::size_t(0); depth < n - 1; ++depth) {
		auto& layer = rv.layers[depth];
		auto num_exited = n - 2 - depth;

		for (auto& exited : subsets(n, num_exited)) {
			auto node = Node();
			node.depth = depth;
			node.exited = exited;
			node.value = config.node_value(num_exited);

			auto remaining = std::vector<std::size_t>();
			for (auto u = std::size_t(0); u < n; ++u)
				if (!contains(exited, u))
					remaining.push_back(u);

			auto scripts = std::vector<std::vector<std::uint8_t>>();
			for (auto u : remaining) {
				auto leaf = Leaf();
				leaf.exiter = u;

				std::vector<std::uint8_t> const* rest_spk = nullptr;
				if (depth == 0) {
					leaf.other = remaining[0] == u ? remaining[1]
								       : remaining[0];
					rest_spk = &participants[leaf.other].scriptPubKey;
				} else {
					auto const& child = rv.layers[depth - 1].at(with(exited, u));
					rest_spk = &child.taproot.scriptPubKey;
				}

				leaf.tx = exit_tx( config, node.value
						 , participants[u].scriptPubKey
						 , *rest_spk
						 , Bitcoin::OutPoint()
						 );
				leaf.commitment = Ctv::template_hash(leaf.tx, 0);
				leaf.script = Ctv::covenant_script(leaf.commitment);
				if (leaf.script.size() > max_script_size)
					throw BuildError(Util::Str::fmt(
						"leaf script of %zu bytes"
						, leaf.script.size()
					));

				scripts.push_back(leaf.script);
				node.leaves.push_back(std::move(leaf));
			}

			try {
				node.taproot = Ctv::TaprootNode::compile(
					scripts, config.network
				);
			} catch (Secp256k1::TapTree::InvalidArg const& e) {
				throw BuildError(e.what());
			}
			for (auto i = std::size_t(0); i < node.leaves.size(); ++i)
				node.leaves[i].control_block = node.taproot.control_blocks[i];

			layer.emplace(exited, std::move(node));
		}
	}

	return rv;
}

Node const& Tree::root() const {
	return layers.back().begin()->second;
}

Node const* Tree::lookup(Path const& path) const {
	auto key = canonical(path);
	if (key.size() > root_depth())
		return nullptr;
	auto const& layer = layers[root_depth() - key.size()];
	auto it = layer.find(key);
	if (it == layer.end())
		return nullptr;
	return &it->second;
}

std::size_t Tree::size() const {
	auto rv = std::size_t(0);
	for (auto const& l : layers)
		rv += l.size();
	return rv;
}

}
