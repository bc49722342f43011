#ifndef POOL_TREE_HPP
#define POOL_TREE_HPP

#include"Pool/Config.hpp"
#include"Pool/Node.hpp"
#include"Pool/Participant.hpp"
#include"Pool/Path.hpp"
#include<cstddef>
#include<map>
#include<vector>

namespace Pool {

/** class Pool::Tree
 *
 * @brief every output the pool can ever be in,
 * with the transactions moving between them.
 *
 * @desc Nodes are keyed by the set of users
 * who have exited, so a node is shared by every
 * exit order reaching it.
 * For N users there are 2^N - N - 1 nodes:
 * every exited set of size 0 to N-2.
 *
 * The tree is immutable once built.
 */
class Tree {
private:
	Config config;
	std::vector<Participant> participants;
	/* Indexed by depth.  */
	std::vector<std::map<Path, Node>> layers;

	Tree() =default;

public:
	Tree(Tree const&) =default;
	Tree(Tree&&) =default;
	Tree& operator=(Tree const&) =default;
	Tree& operator=(Tree&&) =default;

	/** Pool::Tree::build
	 *
	 * @brief validates the configuration, then
	 * builds every node from the terminal layer
	 * up to the root.
	 *
	 * @desc Throws `Pool::ConfigError` before any
	 * work if the configuration or participant
	 * list is unusable, and `Pool::BuildError` if
	 * a node cannot be compiled.
	 * Deterministic: the same inputs always give
	 * the same commitments and addresses.
	 */
	static
	Tree build( Config const& config
		  , std::vector<Participant> const& participants
		  );

	Node const& root() const;
	/* Takes an exit history in any order.  Null if
	 * no node has that exited set; throws
	 * `Pool::ResolveError` if a user repeats.  */
	Node const* lookup(Path const& path) const;

	/* Number of nodes.  */
	std::size_t size() const;
	/* Depth of the root, N - 2.  */
	std::size_t root_depth() const { return layers.size() - 1; }
	std::map<Path, Node> const& layer(std::size_t depth) const {
		return layers.at(depth);
	}

	Config const& get_config() const { return config; }
	std::vector<Participant> const& get_participants() const {
		return participants;
	}
};

}

#endif /* !defined(POOL_TREE_HPP) */
