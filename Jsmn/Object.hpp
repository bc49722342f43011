#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Jsmn/Detail/Iterator.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct Document; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* A value was used as something it is not.  */
class TypeError : public Util::BacktraceException<std::invalid_argument> {
public:
	TypeError()
		: Util::BacktraceException<std::invalid_argument>(
			"Jsmn: value has the wrong type"
		  ) { }
};

/** class Jsmn::Object
 *
 * @brief a read-only view of one JSON value.
 *
 * @desc Copies are cheap and keep the parsed
 * text alive.  A default-constructed Object is
 * null, as is the result of looking up a missing
 * key or an out-of-range index.
 */
class Object {
private:
	std::shared_ptr<Detail::Document const> doc;
	std::size_t at;

	Object(std::shared_ptr<Detail::Document const>, std::size_t);

	friend class Parser;
	friend class Detail::Iterator;

	/* Index of the value stored under the key, or
	 * zero if absent (the root is never a value).  */
	std::size_t find(std::string const& key) const;

public:
	Object();

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* false and null both convert to false; other
	 * non-booleans throw TypeError.  */
	explicit operator bool() const;
	explicit operator std::string() const;
	explicit operator double() const;

	/* Members of an object or elements of an array.  */
	std::size_t size() const;

	std::vector<std::string> keys() const;
	bool has(std::string const& key) const;
	Object operator[](std::string const& key) const;
	Object operator[](std::size_t index) const;

	/* Arrays only.  */
	typedef Detail::Iterator iterator;
	typedef Detail::Iterator const_iterator;
	iterator begin() const;
	iterator end() const;
};

/* Compact single-line JSON.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
