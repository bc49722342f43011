#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Util/make_unique.hpp"

/* jsmn is a single header; its definitions land
 * in this translation unit only.  */
#define JSMN_STATIC 1
#define JSMN_STRICT 1
#include<jsmn.h>

namespace {

Jsmn::Detail::Kind kind_of(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::KindObject;
	case JSMN_ARRAY: return Jsmn::Detail::KindArray;
	case JSMN_STRING: return Jsmn::Detail::KindString;
	default: return Jsmn::Detail::KindPrimitive;
	}
}

/* Fills in `past` for node i and everything
 * under it, returning node i's `past`.  */
std::size_t link(std::vector<Jsmn::Detail::Node>& nodes, std::size_t i) {
	auto next = i + 1;
	for (auto c = std::size_t(0); c < nodes[i].children; ++c)
		next = link(nodes, next);
	nodes[i].past = next;
	return next;
}

bool is_space(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}

namespace Jsmn {

class Parser::Impl {
private:
	std::string buffer;

	/* Scanner state, for finding where a complete
	 * top-level value ends before handing it to
	 * jsmn.  `scanned` is how far into `buffer`
	 * the scanner has looked.  */
	std::size_t scanned;
	unsigned int depth;
	bool in_string;
	bool escaped;
	bool in_bare;

	void restart_scan() {
		scanned = 0;
		depth = 0;
		in_string = false;
		escaped = false;
		in_bare = false;
	}

	/* Returns the length of the first complete value
	 * in buffer, or 0 if there is none yet.  A bare
	 * number or literal includes the whitespace that
	 * ends it, since strict jsmn needs to see it.  */
	std::size_t scan() {
		while (scanned < buffer.size()) {
			auto c = buffer[scanned++];
			if (in_string) {
				if (escaped)
					escaped = false;
				else if (c == '\\')
					escaped = true;
				else if (c == '"') {
					in_string = false;
					if (depth == 0)
						return scanned;
				}
			} else if (in_bare) {
				if (is_space(c))
					return scanned;
			} else if (c == '"') {
				in_string = true;
			} else if (c == '{' || c == '[') {
				++depth;
			} else if (c == '}' || c == ']') {
				if (depth == 0)
					throw ParseError(buffer, scanned - 1);
				if (--depth == 0)
					return scanned;
			} else if (!is_space(c) && depth == 0) {
				in_bare = true;
			}
		}
		return 0;
	}

	Object parse(std::string text) {
		jsmn_parser p;
		jsmn_init(&p);
		auto count = jsmn_parse(&p, text.data(), text.size(), nullptr, 0);
		if (count <= 0)
			throw ParseError(std::move(text), p.pos);

		auto toks = std::vector<jsmntok_t>(std::size_t(count));
		jsmn_init(&p);
		auto res = jsmn_parse( &p, text.data(), text.size()
				     , toks.data(), (unsigned int) toks.size()
				     );
		if (res != count)
			throw ParseError(std::move(text), p.pos);

		auto doc = std::make_shared<Detail::Document>();
		doc->nodes.reserve(toks.size());
		for (auto const& t : toks) {
			auto n = Detail::Node();
			n.kind = kind_of(t.type);
			n.begin = std::size_t(t.start);
			n.end = std::size_t(t.end);
			n.children = std::size_t(t.size);
			n.past = 0;
			doc->nodes.push_back(n);
		}
		if (link(doc->nodes, 0) != doc->nodes.size())
			throw ParseError(std::move(text), 0);
		doc->text = std::move(text);

		return Object(std::move(doc), 0);
	}

public:
	Impl() { restart_scan(); }

	void feed(std::string const& chunk, std::vector<Object>& out) {
		buffer += chunk;
		for (;;) {
			auto len = scan();
			if (len == 0)
				return;
			auto text = buffer.substr(0, len);
			buffer.erase(0, len);
			restart_scan();
			out.push_back(parse(std::move(text)));
		}
	}
};

Parser::Parser() : pimpl(Util::make_unique<Impl>()) { }
Parser::~Parser() =default;

std::vector<Jsmn::Object> Parser::feed(std::string const& chunk) {
	auto ret = std::vector<Jsmn::Object>();
	pimpl->feed(chunk, ret);
	return ret;
}

}
