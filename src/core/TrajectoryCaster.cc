#include "spill/core/TrajectoryCaster.hh"

#include "spill/core/Log.hh"
#include "spill/utils/Profiler.hh"

#include <algorithm>
#include <cmath>
#include <vector>

namespace spill {

namespace {

constexpr const char* kEventSource = "TrajectoryCaster";

} // namespace

TrajectoryCaster::TrajectoryCaster(const SurfaceWorld& world, EventDispatcher& dispatcher)
    : world_(world), dispatcher_(dispatcher) {}

std::optional<CastHandle> TrajectoryCaster::fire(const Vec3f& origin, const Vec3f& direction, float speed,
                                                 const CastBehavior& behavior) {
    Vec3f dir = direction.normalized();
    if (!origin.isFinite() || !dir.isFinite() || dir.lengthSquared() == 0.0f || !std::isfinite(speed)) {
        SPILL_CAST_DEBUG("fire rejected: invalid origin or direction");
        return std::nullopt;
    }

    DropletObject* object = behavior.provider ? behavior.provider() : nullptr;
    if (!object) {
        SPILL_CAST_DEBUG("fire rejected: provider returned no object");
        return std::nullopt;
    }

    ActiveCast cast;
    cast.position = origin;
    cast.velocity = dir * speed;
    cast.acceleration = behavior.acceleration;
    cast.maxDistance = behavior.maxDistance;
    cast.filter = behavior.filter;
    cast.object = object;

    CastId id = nextId_++;
    casts_.emplace(id, std::move(cast));
    SPILL_CAST_DEBUG("cast {} fired with object {} at speed {:.2f}", id, object->id(), speed);
    return CastHandle{id, object};
}

bool TrajectoryCaster::cancel(CastId id) {
    return casts_.erase(id) > 0;
}

void TrajectoryCaster::clear() {
    casts_.clear();
}

void TrajectoryCaster::update(float deltaTime) {
    SPILL_ZONE_SCOPED_N("TrajectoryCaster::update");
    if (deltaTime <= 0.0f || casts_.empty()) {
        return;
    }

    std::vector<CastId> ids;
    ids.reserve(casts_.size());
    for (const auto& [id, _] : casts_) {
        ids.push_back(id);
    }

    for (CastId id : ids) {
        auto it = casts_.find(id);
        if (it == casts_.end()) {
            continue; // cancelled by an earlier handler
        }
        ActiveCast& cast = it->second;

        Vec3f displacement = cast.velocity * deltaTime + cast.acceleration * (0.5f * deltaTime * deltaTime);
        Vec3f nextVelocity = cast.velocity + cast.acceleration * deltaTime;
        float segmentLength = displacement.length();
        if (segmentLength <= 0.0f) {
            cast.velocity = nextVelocity;
            continue;
        }
        Vec3f direction = displacement / segmentLength;

        // Clip the final segment at maxDistance
        float remaining = std::max(0.0f, cast.maxDistance - cast.travelled);
        float castLength = std::min(segmentLength, remaining);

        auto hit = world_.raycast(cast.position, direction, castLength, cast.filter);
        if (hit) {
            float fraction = hit->distance / segmentLength;
            CastImpact impact{id, *hit, cast.velocity + cast.acceleration * (deltaTime * fraction), cast.object};
            casts_.erase(it);

            SPILL_CAST_DEBUG("cast {} hit surface {} after {:.2f}", id, impact.hit.surface,
                             impact.hit.distance);
            Event event(kCastImpact, kEventSource);
            event.setPayload(impact);
            dispatcher_.dispatchEvent(event);
            continue;
        }

        CastSegment segment{id, cast.position, direction, castLength, cast.object};
        cast.position = cast.position + direction * castLength;
        cast.velocity = nextVelocity;
        cast.travelled += castLength;

        bool finished = cast.travelled >= cast.maxDistance;
        CastTerminated terminated{id, cast.position, cast.travelled, cast.object};
        if (finished) {
            casts_.erase(it);
        }

        Event advancing(kCastAdvancing, kEventSource);
        advancing.setPayload(segment);
        dispatcher_.dispatchEvent(advancing);

        if (finished) {
            SPILL_CAST_DEBUG("cast {} terminated after {:.2f}", id, terminated.distance);
            Event event(kCastTerminated, kEventSource);
            event.setPayload(terminated);
            dispatcher_.dispatchEvent(event);
        }
    }
}

} // namespace spill
