// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "utilities.hh"

namespace Loom {

CircularAttachment::CircularAttachment (const StringVector &cycle) :
  Exception ("circular attachment between controls: ", string_join (" -> ", cycle)),
  cycle_ (cycle)
{}

} // Loom
