// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_MAIN_HH__
#define __LOOM_MAIN_HH__

#include <lcore/inout.hh>

#if !defined __LOOM_CORE_HH__ && !defined __LOOM_BUILD__
#error Only <loom-core.hh> can be included directly.
#endif

namespace Loom {

/// Program wide settings, established by init_core().
struct CoreSettings {
  bool  testing;                ///< Running as a unit test program.
  bool  test_verbose;           ///< Unit tests print each test case as it starts.
  bool  fatal_warnings;         ///< Critical warnings abort the program.
};

void                    init_core               (const String &app_ident, int *argcp, char **argv,
                                                 const StringVector &args = StringVector());
bool                    init_core_initialized   ();
const CoreSettings&     core_settings           ();
String                  program_alias           ();
String                  program_ident           ();

// == Command Line Parsing ==
bool    arg_parse_option        (int argc, char **argv, size_t *i, const char *arg);
bool    arg_parse_string_option (int argc, char **argv, size_t *i, const char *arg, const char **strp);
int     arg_parse_collapse      (int *argcp, char **argv);

} // Loom

#endif /* __LOOM_MAIN_HH__ */
