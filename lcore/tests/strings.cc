// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <loom-test.hh>

namespace {
using namespace Loom;

static void
string_formatting (void)
{
  TCMP (string_printf ("%d-%s", 42, "cols"), ==, "42-cols");
  TCMP (string_format ("%s:%d", String ("grid"), 3), ==, "grid:3");
  TCMP (string_format ("%.2f", 0.5), ==, "0.50");
  TCMP (string_format ("plain"), ==, "plain");
}
REGISTER_TEST ("Strings/Formatting", string_formatting);

static void
string_splitting (void)
{
  StringVector words = string_split ("  fill \t row\ngrid  ");
  TCMP (words.size(), ==, 3u);
  TCMP (words[0], ==, "fill");
  TCMP (words[2], ==, "grid");
  TCMP (string_split ("   ").size(), ==, 0u);
  StringVector fields = string_split ("a::b:", ":");
  TCMP (fields.size(), ==, 4u);
  TCMP (fields[1], ==, "");
  TCMP (fields[3], ==, "");
  TCMP (string_join (" -> ", string_split ("x,y,z", ",")), ==, "x -> y -> z");
  TCMP (string_join (", ", StringVector()), ==, "");
  TCMP (string_strip ("\t margin \n"), ==, "margin");
  TCMP (string_strip (" \r "), ==, "");
}
REGISTER_TEST ("Strings/Splitting", string_splitting);

static void
string_booleans (void)
{
  TCMP (string_to_bool ("yes"), ==, true);
  TCMP (string_to_bool (" True"), ==, true);
  TCMP (string_to_bool ("on"), ==, true);
  TCMP (string_to_bool ("Off"), ==, false);
  TCMP (string_to_bool ("0"), ==, false);
  TCMP (string_to_bool ("09"), ==, true);
  TCMP (string_to_bool ("-1"), ==, true);
  TCMP (string_to_bool ("nope"), ==, false);
  TCMP (string_to_bool (""), ==, false);
  TCMP (string_to_bool (" ", true), ==, true);
}
REGISTER_TEST ("Strings/Booleans", string_booleans);

static void
string_options (void)
{
  const String options = "Layout; Grid=0 : margin=4:margin=6::=orphan";
  vector<StringPair> entries = string_option_parse (options);
  TCMP (entries.size(), ==, 4u);
  TCMP (entries[0].first, ==, "Layout");
  TCMP (entries[0].second, ==, "1");
  TCMP (entries[1].first, ==, "Grid");
  TCMP (entries[1].second, ==, "0 ");
  TCMP (string_option_get (options, "margin"), ==, "6");
  TCMP (string_option_get (options, "spacing", "2"), ==, "2");
  TCMP (string_option_check (options, "Layout"), ==, true);
  TCMP (string_option_check (options, "Grid"), ==, false);
  TCMP (string_option_check (options, "Form"), ==, false);
  TCMP (string_option_check ("Form=", "Form"), ==, true);
}
REGISTER_TEST ("Strings/Options", string_options);

} // Anon
