#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Detail/text.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn {

Object::Object() : doc(), at(0) { }
Object::Object(std::shared_ptr<Detail::Document const> doc_, std::size_t at_)
	: doc(std::move(doc_)), at(at_) { }

namespace {

bool primitive_starting(Detail::Document const* d, std::size_t i, char c) {
	return d
	    && d->nodes[i].kind == Detail::KindPrimitive
	    && d->lead(i) == c
	     ;
}

}

bool Object::is_null() const {
	return !doc || primitive_starting(doc.get(), at, 'n');
}
bool Object::is_boolean() const {
	return primitive_starting(doc.get(), at, 't')
	    || primitive_starting(doc.get(), at, 'f')
	     ;
}
bool Object::is_string() const {
	return doc && doc->nodes[at].kind == Detail::KindString;
}
bool Object::is_object() const {
	return doc && doc->nodes[at].kind == Detail::KindObject;
}
bool Object::is_array() const {
	return doc && doc->nodes[at].kind == Detail::KindArray;
}
bool Object::is_number() const {
	return doc
	    && doc->nodes[at].kind == Detail::KindPrimitive
	    && !is_null() && !is_boolean()
	     ;
}

Object::operator bool() const {
	if (is_null())
		return false;
	if (!is_boolean())
		throw TypeError();
	return doc->lead(at) == 't';
}
Object::operator std::string() const {
	if (!is_string())
		throw TypeError();
	return Detail::unescape(doc->slice(at));
}
Object::operator double() const {
	if (!is_number())
		throw TypeError();
	return Detail::read_number(doc->slice(at));
}

std::size_t Object::size() const {
	if (!is_object() && !is_array())
		throw TypeError();
	return doc->nodes[at].children;
}

std::vector<std::string> Object::keys() const {
	if (!is_object())
		throw TypeError();
	auto ret = std::vector<std::string>();
	auto const& nodes = doc->nodes;
	for (auto k = at + 1; k < nodes[at].past; k = nodes[k].past)
		ret.push_back(Detail::unescape(doc->slice(k)));
	return ret;
}

std::size_t Object::find(std::string const& key) const {
	if (!is_object())
		throw TypeError();
	auto const& nodes = doc->nodes;
	for (auto k = at + 1; k < nodes[at].past; k = nodes[k].past)
		if (Detail::unescape(doc->slice(k)) == key)
			return k + 1;
	return 0;
}

bool Object::has(std::string const& key) const {
	return find(key) != 0;
}
Object Object::operator[](std::string const& key) const {
	auto i = find(key);
	if (i == 0)
		return Object();
	return Object(doc, i);
}
Object Object::operator[](std::size_t index) const {
	if (!is_array())
		throw TypeError();
	if (index >= doc->nodes[at].children)
		return Object();
	auto i = at + 1;
	for (auto n = std::size_t(0); n < index; ++n)
		i = doc->nodes[i].past;
	return Object(doc, i);
}

Detail::Iterator Object::begin() const {
	if (!is_array())
		throw TypeError();
	return Detail::Iterator(doc, at + 1);
}
Detail::Iterator Object::end() const {
	if (!is_array())
		throw TypeError();
	return Detail::Iterator(doc, doc->nodes[at].past);
}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	if (o.is_null())
		return os << "null";
	if (o.is_string())
		return os << '"' << Detail::escape(std::string(o)) << '"';
	if (o.is_array()) {
		os << '[';
		auto first = true;
		for (auto e : o) {
			if (!first)
				os << ',';
			first = false;
			os << e;
		}
		return os << ']';
	}
	if (o.is_object()) {
		os << '{';
		auto first = true;
		for (auto const& k : o.keys()) {
			if (!first)
				os << ',';
			first = false;
			os << '"' << Detail::escape(k) << "\":" << o[k];
		}
		return os << '}';
	}
	if (o.is_boolean())
		return os << (bool(o) ? "true" : "false");
	return os << Detail::write_number(double(o));
}

}
