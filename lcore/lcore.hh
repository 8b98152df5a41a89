// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_CORE_HH__
#define __LOOM_CORE_HH__

#include <lcore/cxxaux.hh>
#include <lcore/utilities.hh>
#include <lcore/strings.hh>
#include <lcore/inout.hh>
#include <lcore/main.hh>

/**
 * @brief The Loom namespace encompasses core utilities and the layout engine.
 *
 * The core utilities are available via including <loom-core.hh> and
 * the layout engine can be included via <loom.hh>.
 */
namespace Loom {}

#endif // __LOOM_CORE_HH__
