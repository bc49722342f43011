#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

#include<cstddef>
#include<cstdint>
#include<stdarg.h>
#include<string>
#include<vector>

namespace Util { namespace Str {

/* Lowercase hex, two digits per byte.  */
std::string hexdump(void const* p, std::size_t size);
inline
std::string hexdump(std::vector<std::uint8_t> const& v) {
	return hexdump(v.data(), v.size());
}

/* True if every character is a hex digit and
 * there is an even number of them.  */
bool ishex(std::string const&);
/* Either case accepted.  Throws std::invalid_argument
 * if not `ishex`.  */
std::vector<std::uint8_t> hexread(std::string const&);

/* "a,b,,c" gives four pieces; "" gives none.  */
std::vector<std::string> split(std::string const& s, char sep);

/* printf-style formatting into a std::string.  */
std::string fmt(char const* tpl, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const* tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
