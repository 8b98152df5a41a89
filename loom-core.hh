/**
 * @file loom-core.hh
 * @brief Header file to include the core utilities of the Loom namespace.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <lcore/lcore.hh>
