/**
 * @file loom-test.hh
 * @brief Header file to include unit test parts of the Loom namespace.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <lcore/lcore.hh>
#include <lcore/testutils.hh>
