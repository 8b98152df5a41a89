// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_INOUT_HH__
#define __LOOM_INOUT_HH__

#include <lcore/strings.hh>

namespace Loom {

// == Console Output ==
template<class... Args> void printout (const char *format, const Args &...args) LOOM_PRINTF (1, 0);
template<class... Args> void printerr (const char *format, const Args &...args) LOOM_PRINTF (1, 0);

// == Debug Configuration ==
void    debug_config_add        (const String &option);
void    debug_config_del        (const String &key);
String  debug_config_get        (const String &key, const String &fallback = "");
bool    debug_config_bool       (const String &key, bool fallback = false);
bool    debug_key_enabled       (const char *key);

// == Diagnostic Macros ==
/** @def LOOM_KEY_DEBUG(key, format, ...)
 * Print a debugging message if #$LOOM_DEBUG enables @a key or "all".
 */
#define LOOM_KEY_DEBUG(key, ...)        do { if (LOOM_UNLIKELY (Loom::_loom_debugging) && Loom::debug_key_enabled (key)) \
      Loom::debug_message ('D', key, LOOM_PRETTY_FILE, __LINE__, Loom::string_format (__VA_ARGS__)); } while (0)
/** @def LOOM_CRITICAL(format, ...)
 * Report a recoverable programming error, fatal if the "fatal-warnings" debug option is set.
 */
#define LOOM_CRITICAL(...)              do { Loom::debug_message ('C', NULL, LOOM_PRETTY_FILE, __LINE__, Loom::string_format (__VA_ARGS__)); } while (0)
/// Issue LOOM_CRITICAL() if @a cond does not hold.
#define LOOM_CRITICAL_UNLESS(cond)      do { if (LOOM_LIKELY (cond)) break; \
      Loom::debug_message ('C', NULL, LOOM_PRETTY_FILE, __LINE__, "assertion failed: " #cond); } while (0)
/// Issue LOOM_CRITICAL() and return the optional value if @a cond does not hold.
#define LOOM_ASSERT_RETURN(cond, ...)   do { if (LOOM_LIKELY (cond)) break; \
      Loom::debug_message ('C', NULL, LOOM_PRETTY_FILE, __LINE__, "assertion failed: " #cond); return __VA_ARGS__; } while (0)

#ifdef LOOM_CONVENIENCE
#define critical                LOOM_CRITICAL
#define critical_unless         LOOM_CRITICAL_UNLESS
#define assert_return           LOOM_ASSERT_RETURN
#endif // LOOM_CONVENIENCE

// == Implementation Details ==
/// @cond NOT_4_DOXYGEN
extern volatile bool _loom_debugging;   // cleared once $LOOM_DEBUG turns out to be empty
void printout_string    (const String &string);
void printerr_string    (const String &string);
void debug_message      (char kind, const char *key, const char *file, int line, const String &message);
/// @endcond

/// Print printf-style formatted text on stdout.
template<class... Args> void
printout (const char *format, const Args &...args)
{
  printout_string (string_format (format, args...));
}

/// Print printf-style formatted text on stderr.
template<class... Args> void
printerr (const char *format, const Args &...args)
{
  printerr_string (string_format (format, args...));
}

} // Loom

#endif /* __LOOM_INOUT_HH__ */
