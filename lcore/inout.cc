// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "inout.hh"
#include "main.hh"
#include <stdio.h>
#include <stdlib.h>
#include <mutex>

#include <glib.h>

namespace Loom {

// == Console Output ==
void
printout_string (const String &string)
{
  fflush (stderr);
  fputs (string.c_str(), stdout);
  fflush (stdout);
}

void
printerr_string (const String &string)
{
  fflush (stdout);
  fputs (string.c_str(), stderr);
  fflush (stderr);
}

// == Debug Configuration ==
volatile bool _loom_debugging = true;

struct DebugOverrides {
  std::mutex            mutex;
  map<String,String>    values;
};

static DebugOverrides&
debug_overrides ()
{
  static DebugOverrides *overrides = new DebugOverrides(); // leaked, usable during static destruction
  return *overrides;
}

static String
debug_environment ()
{
  const char *value = g_getenv ("LOOM_DEBUG");
  return value ? value : "";
}

/// Override a #$LOOM_DEBUG option, @a option is "key" (same as "key=1") or "key=value".
void
debug_config_add (const String &option)
{
  const size_t eq = option.find ('=');
  const String key = string_strip (option.substr (0, eq));
  LOOM_ASSERT_RETURN (!key.empty());
  DebugOverrides &overrides = debug_overrides();
  std::lock_guard<std::mutex> locker (overrides.mutex);
  overrides.values[key] = eq == String::npos ? "1" : option.substr (eq + 1);
  _loom_debugging = true;
}

/// Remove the override for @a key added by debug_config_add().
void
debug_config_del (const String &key)
{
  DebugOverrides &overrides = debug_overrides();
  std::lock_guard<std::mutex> locker (overrides.mutex);
  overrides.values.erase (key);
}

/// Value of debug option @a key, overrides take precedence over #$LOOM_DEBUG.
String
debug_config_get (const String &key, const String &fallback)
{
  {
    DebugOverrides &overrides = debug_overrides();
    std::lock_guard<std::mutex> locker (overrides.mutex);
    auto it = overrides.values.find (key);
    if (it != overrides.values.end())
      return it->second;
  }
  return string_option_get (debug_environment(), key, fallback);
}

bool
debug_config_bool (const String &key, bool fallback)
{
  return string_to_bool (debug_config_get (key), fallback);
}

/** Check if debugging messages for @a key are enabled.
 * A key is enabled through an override or through "key" or "all" in #$LOOM_DEBUG,
 * where later entries take precedence, e.g. "all:Layout=0" enables every key but "Layout".
 */
bool
debug_key_enabled (const char *key)
{
  const String config = debug_environment();
  {
    DebugOverrides &overrides = debug_overrides();
    std::lock_guard<std::mutex> locker (overrides.mutex);
    auto it = overrides.values.find (key);
    if (it != overrides.values.end())
      return string_to_bool (it->second, true);
    if (config.empty() && overrides.values.empty())
      {
        _loom_debugging = false;
        return false;
      }
  }
  bool enabled = false;
  for (const StringPair &entry : string_option_parse (config))
    if (entry.first == key || entry.first == "all")
      enabled = string_to_bool (entry.second, true);
  return enabled;
}

// == Diagnostics ==
/** Print a diagnostic message of @a kind on stderr.
 * Kind 'D' is a debugging message for @a key, prefixed with the time since startup.
 * Kind 'C' is a critical warning which aborts if the "fatal-warnings" option is set.
 */
void
debug_message (char kind, const char *key, const char *file, int line, const String &message)
{
  const String where = file ? string_format ("%s:%d: ", file, line) : String();
  switch (kind)
    {
    case 'D':
      printerr ("[%s] %s: %s%s\n", timestamp_format (timestamp_elapsed()), key ? key : "debug", where, message);
      break;
    case 'C':
      printerr ("%s: %sCRITICAL: %s\n", program_alias(), where, message);
      if (debug_config_bool ("fatal-warnings"))
        {
          printerr ("%s: aborting due to fatal-warnings\n", program_alias());
          abort();
        }
      break;
    default:
      printerr ("%s: %s%s\n", program_alias(), where, message);
      break;
    }
}

} // Loom
