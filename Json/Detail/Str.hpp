#ifndef JSON_DETAIL_STR_HPP
#define JSON_DETAIL_STR_HPP

#include<string>

namespace Json { namespace Detail { namespace Str {

/* Escapes the given string for inclusion inside
 * JSON double quotes.  */
std::string to_escaped(std::string const&);

}}}

#endif /* !defined(JSON_DETAIL_STR_HPP) */
