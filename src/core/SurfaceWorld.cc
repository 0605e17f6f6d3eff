#include "spill/core/SurfaceWorld.hh"

#include "spill/core/Log.hh"

#include <algorithm>
#include <cmath>
#include <limits>

namespace spill {

bool RaycastFilter::excludes(SurfaceId id) const {
    return std::find(excluded.begin(), excluded.end(), id) != excluded.end();
}

SurfaceId SurfaceWorld::addBox(const Transformf& pose, const Vec3f& halfExtents, bool movable) {
    SurfaceId id = nextId_++;
    boxes_.emplace(id, SurfaceBox{id, pose, halfExtents, movable});
    return id;
}

bool SurfaceWorld::setTransform(SurfaceId id, const Transformf& pose) {
    auto it = boxes_.find(id);
    if (it == boxes_.end()) {
        return false;
    }
    if (!it->second.movable) {
        SPILL_LOG_WARN("SurfaceWorld: surface {} is static and cannot be moved", id);
        return false;
    }
    it->second.pose = pose;
    return true;
}

bool SurfaceWorld::remove(SurfaceId id) {
    return boxes_.erase(id) > 0;
}

void SurfaceWorld::setGroundPlane(float height) {
    groundHeight_ = height;
}

void SurfaceWorld::clearGroundPlane() {
    groundHeight_.reset();
}

const SurfaceBox* SurfaceWorld::find(SurfaceId id) const {
    auto it = boxes_.find(id);
    return it != boxes_.end() ? &it->second : nullptr;
}

bool SurfaceWorld::isMovable(SurfaceId id) const {
    const SurfaceBox* box = find(id);
    return box && box->movable;
}

std::optional<RayHit> SurfaceWorld::intersectBox(const SurfaceBox& box, const Vec3f& origin, const Vec3f& direction,
                                                 float length) const {
    // Slab test in the box's local frame
    Quatf toLocal = box.pose.getRotation().conjugate();
    Vec3f o = toLocal.rotateVector(origin - box.pose.getPosition());
    Vec3f d = toLocal.rotateVector(direction);

    const float origins[3] = {o.x, o.y, o.z};
    const float dirs[3] = {d.x, d.y, d.z};
    const float half[3] = {box.halfExtents.x, box.halfExtents.y, box.halfExtents.z};

    float tMin = -std::numeric_limits<float>::infinity();
    float tMax = std::numeric_limits<float>::infinity();
    int entryAxis = -1;
    float entrySign = 0.0f;

    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(dirs[axis]) < 1e-8f) {
            if (origins[axis] < -half[axis] || origins[axis] > half[axis]) {
                return std::nullopt;
            }
            continue;
        }

        float t1 = (-half[axis] - origins[axis]) / dirs[axis];
        float t2 = (half[axis] - origins[axis]) / dirs[axis];
        float sign = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            sign = 1.0f;
        }

        if (t1 > tMin) {
            tMin = t1;
            entryAxis = axis;
            entrySign = sign;
        }
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return std::nullopt;
        }
    }

    if (entryAxis < 0 || tMin < 0.0f || tMin > length) {
        return std::nullopt;
    }

    Vec3f localNormal(entryAxis == 0 ? entrySign : 0.0f, entryAxis == 1 ? entrySign : 0.0f,
                      entryAxis == 2 ? entrySign : 0.0f);

    RayHit hit;
    hit.distance = tMin;
    hit.position = origin + direction * tMin;
    hit.normal = box.pose.getRotation().rotateVector(localNormal).normalized();
    hit.surface = box.id;
    return hit;
}

std::optional<RayHit> SurfaceWorld::raycast(const Vec3f& origin, const Vec3f& direction, float length,
                                            const RaycastFilter& filter) const {
    if (!origin.isFinite() || !direction.isFinite() || length <= 0.0f) {
        return std::nullopt;
    }
    Vec3f dir = direction.normalized();
    if (dir.lengthSquared() == 0.0f) {
        return std::nullopt;
    }

    std::optional<RayHit> best;

    // Ordered map: strict < keeps the lower id on equal distances
    for (const auto& [id, box] : boxes_) {
        if (filter.excludes(id)) {
            continue;
        }
        auto hit = intersectBox(box, origin, dir, length);
        if (hit && (!best || hit->distance < best->distance)) {
            best = hit;
        }
    }

    if (groundHeight_ && dir.y < 0.0f && origin.y >= *groundHeight_) {
        float t = (origin.y - *groundHeight_) / -dir.y;
        if (t <= length && (!best || t < best->distance)) {
            RayHit hit;
            hit.distance = t;
            hit.position = origin + dir * t;
            hit.position.y = *groundHeight_;
            hit.normal = Vec3f(0.0f, 1.0f, 0.0f);
            hit.surface = kNoSurface;
            best = hit;
        }
    }

    return best;
}

} // namespace spill
