// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "testutils.hh"
#include <string.h>

namespace Loom {

/// Initialize the Loom core for a unit test program, like init_core() with the "testing" setting.
void
init_core_test (const String &app_ident, int *argcp, char **argv, const StringVector &args)
{
  StringVector settings (1, "testing");
  settings.insert (settings.end(), args.begin(), args.end());
  init_core (app_ident, argcp, argv, settings);
}

namespace Test {

struct TestCase {
  String        name;
  void        (*func) ();
};

static vector<TestCase>&
test_cases ()
{
  static vector<TestCase> *cases = new vector<TestCase>(); // filled during static construction
  return *cases;
}

TestRegistration::TestRegistration (const char *name, void (*func) ())
{
  TestCase tc = { name, func };
  test_cases().push_back (tc);
}

bool
verbose ()
{
  return core_settings().test_verbose;
}

void
assertion_failed (const char *file, int line, const String &message)
{
  printerr ("%s:%d: assertion failed: %s\n", file, line, message);
  breakpoint();
}

void
comparison_failed (const char *file, int line, const char *expression,
                   const String &a, const char *cmp, const String &b)
{
  assertion_failed (file, line, string_format ("'%s': %s %s %s", expression, a, cmp, b));
}

int
run ()
{
  vector<TestCase> cases = test_cases();
  std::stable_sort (cases.begin(), cases.end(), [] (const TestCase &a, const TestCase &b) {
      return strverscmp (a.name.c_str(), b.name.c_str()) < 0;
    });
  for (const TestCase &tc : cases)
    {
      if (verbose())
        printerr ("  RUN    %s\n", tc.name);
      tc.func();
      printerr ("  PASS   %s\n", tc.name);
    }
  LOOM_KEY_DEBUG ("Test", "%s: passed %zu tests", program_ident(), cases.size());
  return 0;
}

} // Test
} // Loom
