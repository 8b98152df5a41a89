// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_UI_HH__
#define __LOOM_UI_HH__

/* public include files */
#include <loom-core.hh>
#include <ui/primitives.hh>
#include <ui/utilities.hh>
#include <ui/control.hh>
#include <ui/layoutdata.hh>
#include <ui/layout.hh>
#include <ui/filllayout.hh>
#include <ui/rowlayout.hh>
#include <ui/gridlayout.hh>
#include <ui/formlayout.hh>
#include <ui/stacklayout.hh>

#endif  /* __LOOM_UI_HH__ */
