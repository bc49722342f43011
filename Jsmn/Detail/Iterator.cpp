#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

Iterator& Iterator::operator++() {
	at = doc->nodes[at].past;
	return *this;
}

Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(doc, at);
}

}}
