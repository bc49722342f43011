#ifndef JSMN_DETAIL_ITERATOR_HPP
#define JSMN_DETAIL_ITERATOR_HPP

#include<cstddef>
#include<memory>
#include<utility>

namespace Jsmn { namespace Detail { struct Document; }}
namespace Jsmn { class Object; }

namespace Jsmn { namespace Detail {

/* Walks the elements of an array.  */
class Iterator {
private:
	std::shared_ptr<Document const> doc;
	std::size_t at;

	friend class Jsmn::Object;
	Iterator(std::shared_ptr<Document const> doc_, std::size_t at_)
		: doc(std::move(doc_)), at(at_) { }

public:
	Iterator() : doc(), at(0) { }

	bool operator==(Iterator const& o) const {
		return doc == o.doc && at == o.at;
	}
	bool operator!=(Iterator const& o) const {
		return !(*this == o);
	}

	Iterator& operator++();
	Iterator operator++(int) {
		auto prev = *this;
		++*this;
		return prev;
	}

	Jsmn::Object operator*() const;
};

}}

#endif /* !defined(JSMN_DETAIL_ITERATOR_HPP) */
