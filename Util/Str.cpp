#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<stdexcept>
#include<stdio.h>

namespace {

char const digits[] = "0123456789abcdef";

int nibble(char c) {
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

}

namespace Util { namespace Str {

std::string hexdump(void const* p, std::size_t size) {
	auto bytes = static_cast<std::uint8_t const*>(p);
	auto rv = std::string(size * 2, '0');
	for (auto i = std::size_t(0); i < size; ++i) {
		rv[2 * i] = digits[bytes[i] >> 4];
		rv[2 * i + 1] = digits[bytes[i] & 0xF];
	}
	return rv;
}

bool ishex(std::string const& s) {
	if (s.size() % 2 != 0)
		return false;
	for (auto c : s)
		if (nibble(c) < 0)
			return false;
	return true;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if (!ishex(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Util::Str::hexread: not hex: " + s
		);
	auto rv = std::vector<std::uint8_t>(s.size() / 2);
	for (auto i = std::size_t(0); i < rv.size(); ++i)
		rv[i] = std::uint8_t((nibble(s[2 * i]) << 4) | nibble(s[2 * i + 1]));
	return rv;
}

std::vector<std::string> split(std::string const& s, char sep) {
	auto rv = std::vector<std::string>();
	if (s.empty())
		return rv;
	auto from = std::size_t(0);
	for (;;) {
		auto at = s.find(sep, from);
		rv.push_back(s.substr(from, at - from));
		if (at == std::string::npos)
			return rv;
		from = at + 1;
	}
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

std::string vfmt(char const* tpl, va_list ap) {
	va_list measure;
	va_copy(measure, ap);
	auto len = vsnprintf(nullptr, 0, tpl, measure);
	va_end(measure);
	if (len < 0)
		throw Util::BacktraceException<std::invalid_argument>(
			std::string("Util::Str::vfmt: bad format: ") + tpl
		);

	auto buf = std::vector<char>(std::size_t(len) + 1);
	vsnprintf(buf.data(), buf.size(), tpl, ap);
	return std::string(buf.data(), std::size_t(len));
}

}}
