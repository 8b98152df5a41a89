// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "main.hh"
#include <string.h>

#include <glib.h>

namespace Loom {

static CoreSettings  core_settings_ = { false, false, false };
static String       *program_ident_ = NULL;

// == Command Line Parsing ==
/// Match @a arg at position @a i of @a argv, a matched argument is set to NULL.
bool
arg_parse_option (int argc, char **argv, size_t *i, const char *arg)
{
  if (*i < size_t (argc) && argv[*i] && strcmp (argv[*i], arg) == 0)
    {
      argv[*i] = NULL;
      return true;
    }
  return false;
}

/** Match "ARG=VALUE" or "ARG VALUE" at position @a i of @a argv and store VALUE in @a strp.
 * Matched arguments are set to NULL, @a i is advanced over a separate VALUE.
 */
bool
arg_parse_string_option (int argc, char **argv, size_t *i, const char *arg, const char **strp)
{
  if (*i >= size_t (argc) || !argv[*i])
    return false;
  const size_t length = strlen (arg);
  const char *current = argv[*i];
  if (strncmp (current, arg, length) != 0)
    return false;
  if (current[length] == '=')
    {
      *strp = current + length + 1;
      argv[*i] = NULL;
      return true;
    }
  if (current[length] == 0 && *i + 1 < size_t (argc) && argv[*i + 1])
    {
      argv[*i] = NULL;
      *i += 1;
      *strp = argv[*i];
      argv[*i] = NULL;
      return true;
    }
  return false;
}

/// Remove the NULL entries from @a argv, returns the number of removed arguments.
int
arg_parse_collapse (int *argcp, char **argv)
{
  const int argc = *argcp;
  if (argc < 1)
    return 0;
  int n = 1;
  for (int i = 1; i < argc; i++)
    if (argv[i])
      argv[n++] = argv[i];
  for (int i = n; i < argc; i++)
    argv[i] = NULL;
  *argcp = n;
  return argc - n;
}

// == Initialization ==
static bool
parse_setting (const String &setting, const char *key, bool *value)
{
  const size_t eq = setting.find ('=');
  if (setting.substr (0, eq) != key)
    return false;
  *value = eq == String::npos || string_to_bool (setting.substr (eq + 1));
  return true;
}

/** Initialize the Loom core for a program identified by @a app_ident.
 * The settings in @a args are "testing" and "test-verbose", each optionally "=BOOL".
 * Recognized command line options ("--fatal-warnings", and "--test-verbose" for tests)
 * are removed from @a argcp and @a argv.
 */
void
init_core (const String &app_ident, int *argcp, char **argv, const StringVector &args)
{
  LOOM_ASSERT_RETURN (!app_ident.empty());
  if (program_ident_)
    {
      LOOM_CRITICAL_UNLESS (app_ident == *program_ident_);
      return;
    }
  program_ident_ = new String (app_ident);
  if (argcp && *argcp > 0 && argv && argv[0] && argv[0][0] && !g_get_prgname())
    {
      char *basename = g_path_get_basename (argv[0]);
      g_set_prgname (basename);
      g_free (basename);
    }
  for (const String &setting : args)
    {
      bool value = false;
      if (parse_setting (setting, "testing", &value))
        core_settings_.testing = value;
      else if (parse_setting (setting, "test-verbose", &value))
        core_settings_.test_verbose = value;
      else
        LOOM_CRITICAL ("unknown init setting: %s", setting);
    }
  const int argc = argcp ? *argcp : 0;
  for (size_t i = 1; i < size_t (argc); i++)
    if (arg_parse_option (argc, argv, &i, "--fatal-warnings"))
      core_settings_.fatal_warnings = true;
    else if (core_settings_.testing && arg_parse_option (argc, argv, &i, "--test-verbose"))
      core_settings_.test_verbose = true;
  if (argcp)
    arg_parse_collapse (argcp, argv);
  const char *test_config = g_getenv ("LOOM_TEST");
  if (core_settings_.testing && test_config && string_option_check (test_config, "test-verbose"))
    core_settings_.test_verbose = true;
  if (debug_config_bool ("fatal-warnings"))
    core_settings_.fatal_warnings = true;
  if (core_settings_.fatal_warnings)
    {
      debug_config_add ("fatal-warnings");
      g_log_set_always_fatal (GLogLevelFlags (G_LOG_FATAL_MASK | G_LOG_LEVEL_WARNING | G_LOG_LEVEL_CRITICAL));
    }
  LOOM_KEY_DEBUG ("StartUp", "%s: testing=%d test-verbose=%d fatal-warnings=%d", app_ident,
                  core_settings_.testing, core_settings_.test_verbose, core_settings_.fatal_warnings);
}

/// Indicates if init_core() has been called.
bool
init_core_initialized ()
{
  return program_ident_ != NULL;
}

const CoreSettings&
core_settings ()
{
  return core_settings_;
}

/// Short program name, the last component of argv[0] as recorded by init_core().
String
program_alias ()
{
  const char *prgname = g_get_prgname();
  return prgname ? prgname : program_ident();
}

/// Identifier passed into init_core().
String
program_ident ()
{
  return program_ident_ ? *program_ident_ : String();
}

} // Loom
