/**
 * @file loom.hh
 * @brief Header file to use the Loom layout engine.
 *
 * Including this will include all parts of the Loom namespace, if
 * only the core parts are needed, see <loom-core.hh>.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <ui/layouts.hh>
