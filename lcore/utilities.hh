// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_CORE_UTILITIES_HH__
#define __LOOM_CORE_UTILITIES_HH__

#include <lcore/cxxaux.hh>

#if !defined __LOOM_CORE_HH__ && !defined __LOOM_BUILD__
#error Only <loom-core.hh> can be included directly.
#endif

/** @def LOOM_PRETTY_FILE
 * Source file name used in diagnostics, prefixed with __FILE_DIR__ if the build defines it.
 */
#ifdef  __FILE_DIR__
#define LOOM_PRETTY_FILE        (__FILE_DIR__ "/" __FILE__)
#else
#define LOOM_PRETTY_FILE        (__FILE__)
#endif

#ifdef LOOM_CONVENIENCE
#define __PRETTY_FILE__         LOOM_PRETTY_FILE
#endif

namespace Loom {

using std::min;
using std::max;

/// Stop in the debugger, terminates the process with SIGTRAP if none is attached.
inline void
breakpoint ()
{
#if defined __i386__ || defined __x86_64__
  __asm__ __volatile__ ("int $03");
#else
  __builtin_trap();
#endif
}

// == Timestamps ==
uint64  timestamp_realtime      ();     // µseconds since the epoch
uint64  timestamp_startup       ();     // timestamp_realtime() at program start
uint64  timestamp_elapsed       ();     // µseconds since program start
String  timestamp_format        (uint64 stamp);

} // Loom

#endif // __LOOM_CORE_UTILITIES_HH__
