#pragma once

#include "spill/core/DropletObject.hh"
#include "spill/core/Event.hh"
#include "spill/core/Spatial.hh"
#include "spill/core/SurfaceWorld.hh"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace spill {

inline constexpr const char* kCastAdvancing = "cast.advancing";
inline constexpr const char* kCastImpact = "cast.impact";
inline constexpr const char* kCastTerminated = "cast.terminated";

using CastId = uint64_t;

// Payload of cast.advancing: the segment travelled this tick.
struct CastSegment {
    CastId cast = 0;
    Vec3f origin;
    Vec3f direction;
    float length = 0.0f;
    DropletObject* object = nullptr;
};

// Payload of cast.impact.
struct CastImpact {
    CastId cast = 0;
    RayHit hit;
    Vec3f velocity;
    DropletObject* object = nullptr;
};

// Payload of cast.terminated: maxDistance reached without a hit.
struct CastTerminated {
    CastId cast = 0;
    Vec3f position;
    float distance = 0.0f;
    DropletObject* object = nullptr;
};

struct CastBehavior {
    Vec3f acceleration;
    float maxDistance = 100.0f;
    RaycastFilter filter;
    // Supplies the cosmetic object carried by the cast. A null result aborts fire().
    std::function<DropletObject*()> provider;
};

struct CastHandle {
    CastId id = 0;
    DropletObject* object = nullptr;
};

// Ballistic ray advance. Each update integrates every active cast under its
// acceleration, raycasts the travelled segment against the SurfaceWorld and
// reports progress through the dispatcher. A cast ends on impact or at
// maxDistance; handlers may fire or cancel casts while being notified.
class TrajectoryCaster {
  public:
    TrajectoryCaster(const SurfaceWorld& world, EventDispatcher& dispatcher);

    std::optional<CastHandle> fire(const Vec3f& origin, const Vec3f& direction, float speed,
                                   const CastBehavior& behavior);

    bool cancel(CastId id);
    void update(float deltaTime);
    void clear();

    size_t activeCount() const { return casts_.size(); }

    TrajectoryCaster(const TrajectoryCaster&) = delete;
    TrajectoryCaster& operator=(const TrajectoryCaster&) = delete;

  private:
    struct ActiveCast {
        Vec3f position;
        Vec3f velocity;
        Vec3f acceleration;
        float travelled = 0.0f;
        float maxDistance = 0.0f;
        RaycastFilter filter;
        DropletObject* object = nullptr;
    };

    const SurfaceWorld& world_;
    EventDispatcher& dispatcher_;
    std::map<CastId, ActiveCast> casts_;
    CastId nextId_ = 1;
};

} // namespace spill
