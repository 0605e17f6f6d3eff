#pragma once

#include "spill/core/Spatial.hh"
#include "spill/core/Types.hh"
#include <map>
#include <optional>
#include <vector>

namespace spill {

// Oriented box a droplet can land on. Movable boxes carry welded pools along.
struct SurfaceBox {
    SurfaceId id = kNoSurface;
    Transformf pose;
    Vec3f halfExtents{0.5f, 0.5f, 0.5f};
    bool movable = false;
};

struct RayHit {
    Vec3f position;
    Vec3f normal;
    SurfaceId surface = kNoSurface;
    float distance = 0.0f;
};

struct RaycastFilter {
    std::vector<SurfaceId> excluded;

    bool excludes(SurfaceId id) const;
};

// Collision geometry for droplet casts: identified boxes plus an optional
// infinite ground plane that has no handle (reported as kNoSurface).
class SurfaceWorld {
  public:
    SurfaceWorld() = default;

    SurfaceId addBox(const Transformf& pose, const Vec3f& halfExtents, bool movable = false);

    // Only movable surfaces can be moved; false for static or unknown ids.
    bool setTransform(SurfaceId id, const Transformf& pose);
    bool remove(SurfaceId id);

    void setGroundPlane(float height);
    void clearGroundPlane();
    std::optional<float> groundHeight() const { return groundHeight_; }

    const SurfaceBox* find(SurfaceId id) const;
    bool isMovable(SurfaceId id) const;
    size_t size() const { return boxes_.size(); }

    // Nearest hit along origin + direction * t for t in [0, length]. Rays that
    // start inside a box do not hit that box. Equal distances resolve to the
    // lower surface id.
    std::optional<RayHit> raycast(const Vec3f& origin, const Vec3f& direction, float length,
                                  const RaycastFilter& filter = {}) const;

  private:
    std::optional<RayHit> intersectBox(const SurfaceBox& box, const Vec3f& origin, const Vec3f& direction,
                                       float length) const;

    std::map<SurfaceId, SurfaceBox> boxes_;
    SurfaceId nextId_ = 1;
    std::optional<float> groundHeight_;
};

} // namespace spill
