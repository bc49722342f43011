#include"Jsmn/Detail/text.hpp"
#include"Jsmn/ParseError.hpp"
#include<cstdint>
#include<limits>
#include<locale>
#include<sstream>

namespace {

char const hexdigits[] = "0123456789abcdef";

int hexval(char c) {
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

void put_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out.push_back(char(cp));
	} else if (cp < 0x800) {
		out.push_back(char(0xC0 | (cp >> 6)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(char(0xE0 | (cp >> 12)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(char(0xF0 | (cp >> 18)));
		out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
}

}

namespace Jsmn { namespace Detail {

std::string escape(std::string const& raw) {
	auto out = std::string();
	out.reserve(raw.size());
	for (auto c : raw) {
		switch (c) {
		case '"': out += "\\\""; continue;
		case '\\': out += "\\\\"; continue;
		case '\b': out += "\\b"; continue;
		case '\f': out += "\\f"; continue;
		case '\n': out += "\\n"; continue;
		case '\r': out += "\\r"; continue;
		case '\t': out += "\\t"; continue;
		}
		auto u = static_cast<unsigned char>(c);
		if (u < 0x20) {
			out += "\\u00";
			out.push_back(hexdigits[u >> 4]);
			out.push_back(hexdigits[u & 0xF]);
		} else {
			out.push_back(c);
		}
	}
	return out;
}

std::string unescape(std::string const& s) {
	auto out = std::string();
	out.reserve(s.size());

	auto i = std::size_t(0);
	auto read_u16 = [&s, &i]() {
		if (s.size() - i < 4)
			throw ParseError(s, i);
		auto v = std::uint32_t(0);
		for (auto k = 0; k < 4; ++k) {
			auto d = hexval(s[i + k]);
			if (d < 0)
				throw ParseError(s, i + k);
			v = (v << 4) | std::uint32_t(d);
		}
		i += 4;
		return v;
	};

	while (i < s.size()) {
		auto c = s[i++];
		if (c != '\\') {
			out.push_back(c);
			continue;
		}
		if (i == s.size())
			throw ParseError(s, i);
		switch (s[i++]) {
		case '"': out.push_back('"'); break;
		case '\\': out.push_back('\\'); break;
		case '/': out.push_back('/'); break;
		case 'b': out.push_back('\b'); break;
		case 'f': out.push_back('\f'); break;
		case 'n': out.push_back('\n'); break;
		case 'r': out.push_back('\r'); break;
		case 't': out.push_back('\t'); break;
		case 'u': {
			auto cp = read_u16();
			/* Surrogate pair.  */
			if ( cp >= 0xD800 && cp < 0xDC00
			  && s.compare(i, 2, "\\u") == 0
			   ) {
				i += 2;
				auto lo = read_u16();
				if (lo < 0xDC00 || lo >= 0xE000)
					throw ParseError(s, i - 4);
				cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
			}
			put_utf8(out, cp);
			break;
		}
		default:
			throw ParseError(s, i - 1);
		}
	}
	return out;
}

double read_number(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto v = double(0);
	is >> v;
	if (!is || is.peek() != std::char_traits<char>::eof())
		throw ParseError(s, 0);
	return v;
}

std::string write_number(double v) {
	auto os = std::ostringstream();
	os.imbue(std::locale::classic());
	os.precision(std::numeric_limits<double>::digits10);
	os << v;
	return os.str();
}

}}
