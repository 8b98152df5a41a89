// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "strings.hh"
#include <stdlib.h>
#include <ctype.h>

#include <glib.h>

namespace Loom {

static const char whitespaces[] = " \t\v\f\n\r";

String
string_printf (const char *format, ...)
{
  va_list args;
  va_start (args, format);
  const String result = string_vprintf (format, args);
  va_end (args);
  return result;
}

String
string_vprintf (const char *format, va_list vargs)
{
  char *cstring = g_strdup_vprintf (format, vargs);
  const String result = cstring ? cstring : "";
  g_free (cstring);
  return result;
}

/** Split @a string at each occurrence of @a separator.
 * Empty fields are kept. Without @a separator, the string is split into its
 * whitespace separated words and empty fields are dropped.
 */
StringVector
string_split (const String &string, const String &separator)
{
  StringVector fields;
  if (separator.empty())
    {
      size_t start = string.find_first_not_of (whitespaces);
      while (start != String::npos)
        {
          const size_t end = string.find_first_of (whitespaces, start);
          fields.push_back (string.substr (start, end == String::npos ? String::npos : end - start));
          start = end == String::npos ? end : string.find_first_not_of (whitespaces, end);
        }
      return fields;
    }
  size_t start = 0;
  for (size_t pos = string.find (separator); pos != String::npos; pos = string.find (separator, start))
    {
      fields.push_back (string.substr (start, pos - start));
      start = pos + separator.size();
    }
  fields.push_back (string.substr (start));
  return fields;
}

String
string_join (const String &separator, const StringVector &strings)
{
  String result;
  for (size_t i = 0; i < strings.size(); i++)
    {
      if (i)
        result += separator;
      result += strings[i];
    }
  return result;
}

/// Remove leading and trailing whitespace from @a string.
String
string_strip (const String &string)
{
  const size_t first = string.find_first_not_of (whitespaces);
  if (first == String::npos)
    return "";
  const size_t last = string.find_last_not_of (whitespaces);
  return string.substr (first, last - first + 1);
}

/** Interpret @a string as a boolean value.
 * Numbers are true if nonzero, words are true if they start with 'y' or 't' or are "on".
 * An empty @a string yields @a fallback.
 */
bool
string_to_bool (const String &string, bool fallback)
{
  const String s = string_strip (string);
  if (s.empty())
    return fallback;
  if (isdigit (s[0]) || s[0] == '+' || s[0] == '-')
    return strtol (s.c_str(), NULL, 10) != 0;
  const char c = tolower (s[0]);
  if (c == 'y' || c == 't')
    return true;
  return c == 'o' && s.size() > 1 && tolower (s[1]) == 'n';
}

/** Parse a colon or semicolon separated list of "key" and "key=value" entries.
 * Keys are stripped of surrounding whitespace, entries without a value get the value "1".
 */
vector<StringPair>
string_option_parse (const String &option_string)
{
  vector<StringPair> entries;
  size_t start = 0;
  while (start <= option_string.size())
    {
      size_t end = option_string.find_first_of (":;", start);
      if (end == String::npos)
        end = option_string.size();
      const String entry = option_string.substr (start, end - start);
      const size_t eq = entry.find ('=');
      const String key = string_strip (entry.substr (0, eq));
      if (!key.empty())
        entries.push_back (StringPair (key, eq == String::npos ? "1" : entry.substr (eq + 1)));
      start = end + 1;
    }
  return entries;
}

/// Value of the last @a option entry in @a option_string, or @a fallback if there is none.
String
string_option_get (const String &option_string, const String &option, const String &fallback)
{
  String value = fallback;
  for (const StringPair &entry : string_option_parse (option_string))
    if (entry.first == option)
      value = entry.second;
  return value;
}

/// Check if @a option is present in @a option_string and not disabled by a false value.
bool
string_option_check (const String &option_string, const String &option)
{
  bool enabled = false;
  for (const StringPair &entry : string_option_parse (option_string))
    if (entry.first == option)
      enabled = string_to_bool (entry.second, true);
  return enabled;
}

} // Loom
