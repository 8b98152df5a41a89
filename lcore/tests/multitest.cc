// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <loom-test.hh>
#include <stdlib.h>

namespace { // Anon
using namespace Loom;

static void
test_preprocessor ()
{
  TCMP (String (LOOM_CPP_STRINGIFY (LOOM_CPP_PASTE2 (grid, 42))), ==, "grid42");
  TCMP (String (LOOM_CPP_STRINGIFY (__LINE__)).size(), >, 0u);
  TCMP (MIN (3, -7), ==, -7);
  TCMP (MAX (3, -7), ==, 3);
  TCMP (CLAMP (12, 0, 10), ==, 10);
  TCMP (CLAMP (-2, 0, 10), ==, 0);
  TCMP (CLAMP (4, 0, 10), ==, 4);
  const int cells[] = { 1, 2, 3, 4, 5 };
  TCMP (ARRAY_SIZE (cells), ==, 5u);
}
REGISTER_TEST ("Core/Preprocessor", test_preprocessor);

static void
test_debug_config ()
{
  const char *key = "loom-test-option";
  TCMP (debug_config_get (key), ==, "");
  TCMP (debug_config_get (key, "fallback"), ==, "fallback");
  debug_config_add ("loom-test-option=columns");
  TCMP (debug_config_get (key), ==, "columns");
  debug_config_add (key);
  TCMP (debug_config_get (key), ==, "1");
  TCMP (debug_config_bool (key), ==, true);
  debug_config_add ("loom-test-option=0");
  TCMP (debug_config_bool (key, true), ==, false);
  debug_config_del (key);
  TCMP (debug_config_get (key), ==, "");
  TCMP (debug_config_bool (key), ==, false);
  TCMP (debug_config_bool (key, true), ==, true);
}
REGISTER_TEST ("Core/Debug Configuration", test_debug_config);

static void
test_debug_keys ()
{
  const char *saved = getenv ("LOOM_DEBUG");
  const String previous = saved ? saved : "";
  setenv ("LOOM_DEBUG", "Layout:Grid=0", 1);
  TCMP (debug_key_enabled ("Layout"), ==, true);
  TCMP (debug_key_enabled ("Grid"), ==, false);
  TCMP (debug_key_enabled ("Form"), ==, false);
  TCMP (debug_config_get ("Layout"), ==, "1");
  setenv ("LOOM_DEBUG", "all:Grid=0", 1);
  TCMP (debug_key_enabled ("Form"), ==, true);
  TCMP (debug_key_enabled ("Grid"), ==, false);
  setenv ("LOOM_DEBUG", "Grid=0;all", 1);
  TCMP (debug_key_enabled ("Grid"), ==, true);
  // overrides take precedence over the environment
  debug_config_add ("Grid=no");
  TCMP (debug_key_enabled ("Grid"), ==, false);
  debug_config_del ("Grid");
  TCMP (debug_key_enabled ("Grid"), ==, true);
  if (saved)
    setenv ("LOOM_DEBUG", previous.c_str(), 1);
  else
    unsetenv ("LOOM_DEBUG");
}
REGISTER_TEST ("Core/Debug Keys", test_debug_keys);

static int
checked_half (int value)
{
  LOOM_ASSERT_RETURN (value >= 0, -1);
  return value / 2;
}

static void
test_assert_return ()
{
  TCMP (checked_half (8), ==, 4);
  TCMP (checked_half (-8), ==, -1);    // prints a critical warning
}
REGISTER_TEST ("Core/Assert Return", test_assert_return);

static void
test_timestamps ()
{
  TCMP (timestamp_startup(), >, 0u);
  TCMP (timestamp_realtime(), >=, timestamp_startup());
  TCMP (timestamp_elapsed(), <, 3600 * 1000000ULL);
  TCMP (timestamp_format (1500000), ==, "1.500000");
  TCMP (timestamp_format (12000042), ==, "12.000042");
  TCMP (timestamp_format (0), ==, "0.000000");
}
REGISTER_TEST ("Core/Timestamps", test_timestamps);

static void
test_program_info ()
{
  TASSERT (init_core_initialized());
  TASSERT (core_settings().testing);
  TCMP (program_alias(), !=, "");
  const String ident = program_ident();
  TCMP (ident.substr (ident.size() - 12), ==, "multitest.cc");
}
REGISTER_TEST ("Core/Program Info", test_program_info);

static void
test_arg_parsing ()
{
  char arg0[] = "layouts", arg1[] = "--layout=grid", arg2[] = "--fill", arg3[] = "--columns", arg4[] = "3",
    arg5[] = "extra", arg6[] = "--columns";
  char *argv[] = { arg0, arg1, arg2, arg3, arg4, arg5, arg6, NULL };
  int argc = 7;
  const char *layout = NULL, *columns = NULL;
  bool fill = false;
  for (size_t i = 1; i < size_t (argc); i++)
    if (arg_parse_string_option (argc, argv, &i, "--layout", &layout))
      continue;
    else if (arg_parse_string_option (argc, argv, &i, "--columns", &columns))
      continue;
    else if (arg_parse_option (argc, argv, &i, "--fill"))
      fill = true;
  TCMPS (layout, ==, "grid");
  TCMPS (columns, ==, "3");
  TASSERT (fill);
  TASSERT (argv[6] != NULL);   // trailing option without value is left alone
  TCMP (arg_parse_collapse (&argc, argv), ==, 4);
  TCMP (argc, ==, 3);
  TCMPS (argv[0], ==, "layouts");
  TCMPS (argv[1], ==, "extra");
  TCMPS (argv[2], ==, "--columns");
  TASSERT (argv[3] == NULL);
}
REGISTER_TEST ("Core/Argument Parsing", test_arg_parsing);

} // Anon

int
main (int   argc,
      char *argv[])
{
  init_core_test (__PRETTY_FILE__, &argc, argv);

  return Test::run();
}
