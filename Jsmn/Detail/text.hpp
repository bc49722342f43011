#ifndef JSMN_DETAIL_TEXT_HPP
#define JSMN_DETAIL_TEXT_HPP

#include<string>

namespace Jsmn { namespace Detail {

/* Quotes are not added or expected.  */
std::string escape(std::string const& raw);
/* Throws Jsmn::ParseError on a malformed escape.
 * \u escapes are re-encoded as UTF-8.  */
std::string unescape(std::string const& escaped);

/* Locale-independent number conversions.  */
double read_number(std::string const&);
std::string write_number(double);

}}

#endif /* !defined(JSMN_DETAIL_TEXT_HPP) */
