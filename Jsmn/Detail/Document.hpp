#ifndef JSMN_DETAIL_DOCUMENT_HPP
#define JSMN_DETAIL_DOCUMENT_HPP

#include<cstddef>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail {

enum Kind {
	KindObject,
	KindArray,
	KindString,
	/* Numbers, booleans and null.  */
	KindPrimitive
};

/* One jsmn token, plus the index just past
 * everything nested inside it.  Nodes are in
 * document order, so the first child of node i
 * (if any) is node i + 1.
 */
struct Node {
	Kind kind;
	std::size_t begin;
	std::size_t end;
	/* Members of an object, elements of an array.
	 * Object keys are nodes with one child.  */
	std::size_t children;
	std::size_t past;
};

/* A single parsed JSON text, shared by every
 * Jsmn::Object that refers into it.  */
struct Document {
	std::string text;
	std::vector<Node> nodes;

	std::string slice(std::size_t i) const {
		auto const& n = nodes[i];
		return text.substr(n.begin, n.end - n.begin);
	}
	char lead(std::size_t i) const {
		return text[nodes[i].begin];
	}
};

}}

#endif /* !defined(JSMN_DETAIL_DOCUMENT_HPP) */
