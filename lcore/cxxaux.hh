// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_CXXAUX_HH__
#define __LOOM_CXXAUX_HH__

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>                  // uint
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <map>

#if !defined __GNUC__ || __GNUC__ < 4
#error Loom needs GCC >= 4 or a compiler that understands its attributes
#endif

// == Attributes and Hints ==
#define LOOM_PRINTF(fmt_idx, arg_idx)   __attribute__ ((__format__ (__printf__, fmt_idx, arg_idx)))
#define LOOM_NORETURN                   __attribute__ ((__noreturn__))
#define LOOM_LIKELY(expr)               __builtin_expect (bool (expr), true)
#define LOOM_UNLIKELY(expr)             __builtin_expect (bool (expr), false)

// == Preprocessor ==
#define LOOM_CPP_STRINGIFY_(s)          #s
#define LOOM_CPP_STRINGIFY(s)           LOOM_CPP_STRINGIFY_ (s)         ///< String literal of the expansion of @a s.
#define LOOM_CPP_PASTE2_(a,b)           a ## b
#define LOOM_CPP_PASTE2(a,b)            LOOM_CPP_PASTE2_ (a,b)          ///< Token formed from the expansions of @a a and @a b.

// == Arithmetic Shorthands ==
#define LOOM_MIN(a,b)                   ((b) < (a) ? (b) : (a))
#define LOOM_MAX(a,b)                   ((a) < (b) ? (b) : (a))
#define LOOM_CLAMP(v,lo,hi)             LOOM_MAX (lo, LOOM_MIN (v, hi))
#define LOOM_ARRAY_SIZE(array)          (sizeof (array) / sizeof ((array)[0]))
#undef  MIN
#define MIN                             LOOM_MIN
#undef  MAX
#define MAX                             LOOM_MAX
#undef  CLAMP
#define CLAMP                           LOOM_CLAMP
#undef  ARRAY_SIZE
#define ARRAY_SIZE                      LOOM_ARRAY_SIZE

/** @def LOOM_CONVENIENCE
 * Define before including <loom-core.hh> or <loom.hh> to get the unprefixed
 * shorthands critical(), critical_unless(), assert_return() and __PRETTY_FILE__.
 */

/// Disable copy construction and copy assignment for @a ClassName.
#define LOOM_CLASS_NON_COPYABLE(ClassName)              \
  ClassName             (const ClassName&) = delete;    \
  ClassName& operator=  (const ClassName&) = delete

namespace Loom {

typedef int64_t                 int64;
typedef uint64_t                uint64;         ///< Unsigned 64 bit integer, used for µsecond timestamps.
typedef std::string             String;
using std::vector;
using std::map;
typedef vector<String>          StringVector;

} // Loom

#endif // __LOOM_CXXAUX_HH__
