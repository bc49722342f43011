#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/text.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

/* Renders one value as JSON text.  */
template<typename a, typename Enable = void>
struct Render;

/* Integers go through 64-bit types so that
 * 8-bit ones print as numbers.  */
template<typename a>
struct Render< a
	     , typename std::enable_if< std::is_integral<a>::value
				     && !std::is_same<a, bool>::value
				      >::type
	     > {
	static std::string text(a v) {
		typedef typename std::conditional< std::is_signed<a>::value
						 , std::int64_t
						 , std::uint64_t
						 >::type wide;
		return std::to_string(wide(v));
	}
};
template<>
struct Render<bool> {
	static std::string text(bool v) { return v ? "true" : "false"; }
};
template<>
struct Render<double> {
	static std::string text(double v) {
		return Jsmn::Detail::write_number(v);
	}
};
template<>
struct Render<std::string> {
	static std::string text(std::string const& v) {
		return '"' + Jsmn::Detail::escape(v) + '"';
	}
};
template<std::size_t n>
struct Render<char [n]> {
	static std::string text(char const (&v)[n]) {
		return Render<std::string>::text(std::string(v));
	}
};
template<>
struct Render<std::nullptr_t> {
	static std::string text(std::nullptr_t) { return "null"; }
};
template<>
struct Render<Jsmn::Object> {
	static std::string text(Jsmn::Object const& v) {
		auto os = std::ostringstream();
		os << v;
		return os.str();
	}
};

/* Shared by objects and arrays: writes the
 * separators between items.  */
class Scope {
protected:
	std::ostream& os;
	bool empty;

	Scope(std::ostream& os_, char open) : os(os_), empty(true) {
		os << open;
	}
	void next_item() {
		if (!empty)
			os << ',';
		empty = false;
	}
	void key(std::string const& name) {
		next_item();
		os << Render<std::string>::text(name) << ':';
	}
};

template<typename Up> class Array;

template<typename Up>
class Object : private Scope {
private:
	Up& up;

public:
	Object(Up& up_, std::ostream& os_) : Scope(os_, '{'), up(up_) { }

	template<typename a>
	Object& field(std::string const& name, a const& value) {
		key(name);
		os << Render<a>::text(value);
		return *this;
	}

	Array<Object> start_array(std::string const& name) {
		key(name);
		return Array<Object>(*this, os);
	}
	Object<Object> start_object(std::string const& name) {
		key(name);
		return Object<Object>(*this, os);
	}

	Up& end_object() {
		os << '}';
		return up;
	}
};

template<typename Up>
class Array : private Scope {
private:
	Up& up;

public:
	Array(Up& up_, std::ostream& os_) : Scope(os_, '['), up(up_) { }

	template<typename a>
	Array& entry(a const& value) {
		next_item();
		os << Render<a>::text(value);
		return *this;
	}

	Array<Array> start_array() {
		next_item();
		return Array<Array>(*this, os);
	}
	Object<Array> start_object() {
		next_item();
		return Object<Array>(*this, os);
	}

	Up& end_array() {
		os << ']';
		return up;
	}
};

}

/** class Json::Out
 *
 * @brief builds JSON text, nesting by chained
 * calls:
 *
 *     Json::Out().start_object()
 *         .field("method", std::string("getbalance"))
 *         .start_array("params")
 *         .end_array()
 *     .end_object()
 *
 * @desc Copies share one buffer.  A finished
 * Out can itself be a field or entry value.
 */
class Out {
private:
	std::shared_ptr<std::ostringstream> buf;

public:
	Out() : buf(std::make_shared<std::ostringstream>()) { }
	explicit
	Out(Jsmn::Object const& js) : Out() {
		*buf << js;
	}

	std::string output() const { return buf->str(); }

	Detail::Object<Out> start_object() {
		return Detail::Object<Out>(*this, *buf);
	}
	Detail::Array<Out> start_array() {
		return Detail::Array<Out>(*this, *buf);
	}

	static
	Out empty_object() {
		return Out().start_object().end_object();
	}
};

namespace Detail {

template<>
struct Render<Json::Out> {
	static std::string text(Json::Out const& v) { return v.output(); }
};

}

}

#endif /* !defined(JSON_OUT_HPP) */
