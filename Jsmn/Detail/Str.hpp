#ifndef JSMN_DETAIL_STR_HPP
#define JSMN_DETAIL_STR_HPP

#include<string>

namespace Jsmn { namespace Detail { namespace Str {

/* Escapes text for the inside of a JSON string literal.  */
std::string to_escaped(std::string const&);
/* Undoes JSON escapes, writing `\u` escapes as UTF-8.
 * Throws Jsmn::ParseError on a malformed escape.
 */
std::string from_escaped(std::string const&);

/* Locale-independent number text, both ways.  */
double to_double(std::string const&);
std::string from_double(double);

}}}

#endif /* !defined(JSMN_DETAIL_STR_HPP) */
