// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_STRINGS_HH__
#define __LOOM_STRINGS_HH__

#include <lcore/utilities.hh>

namespace Loom {

// == Formatting ==
String  string_printf           (const char *format, ...) LOOM_PRINTF (1, 2);
String  string_vprintf          (const char *format, va_list vargs);
template<class... Args>
String  string_format           (const char *format, const Args &...args) LOOM_PRINTF (1, 0);

// == Splitting and Conversion ==
StringVector string_split       (const String &string, const String &separator = "");
String       string_join        (const String &separator, const StringVector &strings);
String       string_strip       (const String &string);
bool         string_to_bool     (const String &string, bool fallback = false);

// == Option Strings ==
typedef std::pair<String,String> StringPair;
vector<StringPair> string_option_parse (const String &option_string);
String             string_option_get   (const String &option_string, const String &option, const String &fallback = "");
bool               string_option_check (const String &option_string, const String &option);

// == Implementation Details ==
/// @cond NOT_4_DOXYGEN
template<class A> inline const A&       string_format_arg (const A &arg)        { return arg; }
inline const char*                      string_format_arg (const String &arg)   { return arg.c_str(); }
/// @endcond

/** Printf-like formatting that also accepts String arguments for "%s".
 * The argument list is checked against @a format like for printf() by the compiler.
 */
template<class... Args> String
string_format (const char *format, const Args &...args)
{
  return string_printf (format, string_format_arg (args)...);
}

} // Loom

#endif /* __LOOM_STRINGS_HH__ */
