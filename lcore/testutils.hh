// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_TESTUTILS_HH__
#define __LOOM_TESTUTILS_HH__

#include <lcore/main.hh>
#include <type_traits>
#include <utility>

namespace Loom {

void    init_core_test  (const String &app_ident, int *argcp, char **argv, const StringVector &args = StringVector());

namespace Test {

// == Assertions ==
/// Fail the current test unless @a cond holds.
#define TASSERT(cond)           do { if (LOOM_LIKELY (cond)) break; \
      Loom::Test::assertion_failed (LOOM_PRETTY_FILE, __LINE__, #cond); } while (0)
/// Fail the current test unless @a a @a cmp @a b holds, both operands are printed on failure.
#define TCMP(a,cmp,b)           do { if (LOOM_LIKELY ((a) cmp (b))) break; \
      Loom::Test::comparison_failed (LOOM_PRETTY_FILE, __LINE__, #a " " #cmp " " #b, \
                                     Loom::Test::test_value (a, #a), #cmp, Loom::Test::test_value (b, #b)); } while (0)
/// Variant of TCMP() that compares C strings by content.
#define TCMPS(a,cmp,b)          TCMP (Loom::Test::cstring_value (a), cmp, Loom::Test::cstring_value (b))

/// Register @a func to be run by Test::run() as test case @a name.
#define REGISTER_TEST(name, func)       \
  static const Loom::Test::TestRegistration LOOM_CPP_PASTE2 (loom_test_registration_, __LINE__) (name, func)

// == Test Runner ==
int     run             ();     ///< Run all registered tests in the order of their names.
bool    verbose         ();     ///< Indicates whether test cases are announced before they run.

class TestRegistration {
public:
  explicit TestRegistration (const char *name, void (*func) ());
};

/// @cond NOT_4_DOXYGEN
void    assertion_failed  (const char *file, int line, const String &message);
void    comparison_failed (const char *file, int line, const char *expression,
                           const String &a, const char *cmp, const String &b);

inline String
cstring_value (const char *s)
{
  return s ? s : "(null)";
}

// printable rendition of a compared value, the expression text for unknown types
template<class V, class Enable = void>
struct TestValue {
  static String string (const V &v, const char *expr) { return expr; }
};
template<class V>
struct TestValue<V, typename std::enable_if<std::is_integral<V>::value>::type> {
  static String
  string (const V &v, const char *expr)
  {
    return std::is_signed<V>::value ? string_format ("%lld", (long long) v) : string_format ("%llu", (unsigned long long) v);
  }
};
template<class V>
struct TestValue<V, typename std::enable_if<std::is_floating_point<V>::value>::type> {
  static String string (const V &v, const char *expr) { return string_format ("%.17g", double (v)); }
};
template<class V>
struct TestValue<V, decltype (void (std::declval<const V&>().string()))> {
  static String string (const V &v, const char *expr) { return v.string(); }
};
template<>
struct TestValue<String> {
  static String string (const String &v, const char *expr) { return "\"" + v + "\""; }
};
template<>
struct TestValue<const char*> {
  static String string (const char *v, const char *expr) { return v ? "\"" + String (v) + "\"" : "NULL"; }
};
template<>
struct TestValue<char*> : TestValue<const char*> {};

template<class V> inline String
test_value (const V &value, const char *expr)
{
  return TestValue<typename std::decay<V>::type>::string (value, expr);
}
/// @endcond

} // Test
} // Loom

#endif /* __LOOM_TESTUTILS_HH__ */
