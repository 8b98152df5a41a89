// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_UI_UTILITIES_HH__
#define __LOOM_UI_UTILITIES_HH__

#include <loom-core.hh>
#include <exception>

#if !defined __LOOM_UI_HH__ && !defined __LOOM_BUILD__
#error Only <loom.hh> can be included directly.
#endif

namespace Loom {

/// Error raised by the layout engine, the reason is the concatenation of all constructor arguments.
class Exception : public std::exception {
  String reason_;
public:
  template<class... Rest> explicit
  Exception (const String &first, const Rest &...rest) :
    reason_ (string_join ("", StringVector { first, String (rest)... }))
  {}
  virtual const char* what () const throw() override { return reason_.c_str(); }
};

/// Raised by FormLayout if control attachments depend on each other in a cycle.
class CircularAttachment : public Exception {
  StringVector cycle_;
public:
  explicit            CircularAttachment (const StringVector &cycle);
  const StringVector& cycle              () const { return cycle_; } ///< Names of the controls on the cycle, first name repeated last.
};

} // Loom

#endif  /* __LOOM_UI_UTILITIES_HH__ */
