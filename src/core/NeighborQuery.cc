#include "spill/core/NeighborQuery.hh"

#include "spill/utils/Profiler.hh"

namespace spill {

DropletObject* findNearestPool(const std::vector<DropletObject*>& candidates, const DropletObject& self,
                               const Vec3f& position, float radius) {
    SPILL_ZONE_SCOPED_N("findNearestPool");

    DropletObject* nearest = nullptr;
    float bestDistance = radius;

    for (DropletObject* candidate : candidates) {
        if (!candidate || candidate == &self || !candidate->parented() || !candidate->anchored() ||
            candidate->weld()) {
            continue;
        }
        if (candidate->state() != DropletState::Landed || candidate->kind() != self.kind()) {
            continue;
        }

        float distance = (candidate->position() - position).length();
        if (distance >= radius) {
            continue;
        }
        if (!nearest || distance < bestDistance ||
            (distance == bestDistance && candidate->id() < nearest->id())) {
            nearest = candidate;
            bestDistance = distance;
        }
    }
    return nearest;
}

} // namespace spill
