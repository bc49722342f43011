#include"Bitcoin/varint.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/tagged_hashes.hpp"
#include<sstream>

namespace {

using Secp256k1::TapTree::Tree;

/* Hashes leaves [b, e) into a subtree, appending the
 * subtree's sibling-to-be onto each covered path later.  */
Sha256::Hash build_sub(Tree& t, std::size_t b, std::size_t e) {
	if (e - b == 1)
		return t.leaves[b];

	auto mid = b + (e - b + 1) / 2;
	auto left = build_sub(t, b, mid);
	auto right = build_sub(t, mid, e);

	for (auto i = b; i < mid; ++i)
		t.paths[i].push_back(right);
	for (auto i = mid; i < e; ++i)
		t.paths[i].push_back(left);

	return Secp256k1::TapTree::branch_hash(left, right);
}

}

namespace Secp256k1 { namespace TapTree {

std::vector<std::uint8_t>
encoded_leaf(std::vector<std::uint8_t> const& script) {
	auto os = std::ostringstream();
	os << Bitcoin::varint(script.size());
	auto prefix = os.str();

	auto leafbuf = std::vector<std::uint8_t>();
	leafbuf.reserve(1 + prefix.size() + script.size());
	/* BIP-342 tapscript leaf version.  */
	leafbuf.push_back(0xc0);
	leafbuf.insert(leafbuf.end(), prefix.begin(), prefix.end());
	leafbuf.insert(leafbuf.end(), script.begin(), script.end());
	return leafbuf;
}

Sha256::Hash leaf_hash(std::vector<std::uint8_t> const& script) {
	return tagged_hash(Tag::LEAF, encoded_leaf(script));
}

Sha256::Hash branch_hash(Sha256::Hash const& a, Sha256::Hash const& b) {
	auto buf = std::vector<std::uint8_t>(64);
	if (b < a) {
		b.to_buffer(&buf[0]);
		a.to_buffer(&buf[32]);
	} else {
		a.to_buffer(&buf[0]);
		b.to_buffer(&buf[32]);
	}
	return tagged_hash(Tag::BRANCH, buf);
}

Tree build(std::vector<std::vector<std::uint8_t>> const& scripts) {
	if (scripts.empty())
		throw InvalidArg("script tree needs at least one leaf");

	auto t = Tree();
	t.leaves.reserve(scripts.size());
	for (auto const& s : scripts)
		t.leaves.push_back(leaf_hash(s));
	t.paths.resize(scripts.size());

	t.root = build_sub(t, 0, scripts.size());
	return t;
}

}}
