// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "utilities.hh"
#include "strings.hh"

#include <glib.h>

namespace Loom {

static uint64 startup_stamp = 0;

namespace { // Anon
static struct StartupStamp { StartupStamp() { timestamp_startup(); } } startup_stamp_init;
} // Anon

/// Current wall clock time in µseconds.
uint64
timestamp_realtime ()
{
  return g_get_real_time();
}

/// Wall clock time of the first timestamp query, which happens during static construction.
uint64
timestamp_startup ()
{
  if (LOOM_UNLIKELY (!startup_stamp))
    startup_stamp = timestamp_realtime();
  return startup_stamp;
}

uint64
timestamp_elapsed ()
{
  const uint64 start = timestamp_startup(), now = timestamp_realtime();
  return now > start ? now - start : 0;
}

/// Render µseconds @a stamp as seconds with six decimals, e.g. "1.500000".
String
timestamp_format (uint64 stamp)
{
  return string_format ("%llu.%06llu", (unsigned long long) (stamp / 1000000), (unsigned long long) (stamp % 1000000));
}

} // Loom
