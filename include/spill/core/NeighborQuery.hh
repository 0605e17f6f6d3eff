#pragma once

#include "spill/core/DropletObject.hh"
#include "spill/core/Spatial.hh"
#include <vector>

namespace spill {

// Linear scan for the landed pool nearest to `position`.
//
// A candidate qualifies when it is parented, anchored, not welded to a movable
// surface and Landed (so not decaying, expanding or still in flight), is not
// `self`, shares `self`'s kind, and lies strictly closer than `radius`. Ties
// go to the lower object id, so the result does not depend on scan order.
// Returns nullptr when nothing qualifies.
DropletObject* findNearestPool(const std::vector<DropletObject*>& candidates, const DropletObject& self,
                               const Vec3f& position, float radius);

} // namespace spill
