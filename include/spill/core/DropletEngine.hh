#pragma once

#include "spill/core/DropletConfig.hh"
#include "spill/core/DropletObject.hh"
#include "spill/core/Effects.hh"
#include "spill/core/Event.hh"
#include "spill/core/FlightRegistry.hh"
#include "spill/core/SurfaceWorld.hh"
#include "spill/core/TimerQueue.hh"
#include "spill/core/TrajectoryCaster.hh"
#include "spill/core/TweenPlayer.hh"
#include "spill/utils/ErrorHandling.hh"
#include "spill/utils/ObjectPool.hh"
#include "spill/utils/RandomSource.hh"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spill {

// Where an emission starts: a world point, or a point fixed to a surface.
struct EmitOrigin {
    std::optional<SurfaceId> surface;
    Vec3f point;

    static EmitOrigin world(const Vec3f& position) { return EmitOrigin{std::nullopt, position}; }
    static EmitOrigin attached(SurfaceId id, const Vec3f& localOffset) { return EmitOrigin{id, localOffset}; }
};

struct EngineStats {
    size_t freeObjects = 0;
    size_t inUseObjects = 0;
    size_t createdObjects = 0;
    size_t inFlight = 0;
    size_t landed = 0;
    size_t registrySize = 0;
    uint64_t emitted = 0;
    uint64_t droppedEmissions = 0;
    uint64_t merges = 0;
    uint64_t recycled = 0;
};

// Droplet lifecycle orchestrator for one emitter.
//
// Owns the object pool, the flight registry, the caster and the scheduling
// collaborators; nothing is shared between engines. Objects move through
// Pooled -> Flying -> (Landed [-> Expanding] -> Decaying | Merging) -> Pooled.
// All work happens inside update() and the calls below on one thread.
class DropletEngine {
  public:
    // Throws SpillException when `config` fails validation.
    DropletEngine(DropletConfig config, SurfaceWorld& world, std::shared_ptr<EffectSink> effects = nullptr,
                  std::optional<uint32_t> seed = std::nullopt);
    ~DropletEngine();

    DropletEngine(const DropletEngine&) = delete;
    DropletEngine& operator=(const DropletEngine&) = delete;

    // Spawns one droplet. False when the pool is exhausted, the origin cannot
    // be resolved or the overrides produce an invalid snapshot.
    bool emit(const EmitOrigin& origin, std::optional<Vec3f> direction = std::nullopt,
              const DropletOverrides& overrides = {});

    // First emission is immediate, the rest are spaced `delayBetween` apart on
    // the timer queue. A negative delay samples the droplet_delay range per gap.
    void emitAmount(const EmitOrigin& origin, std::optional<Vec3f> direction, int count, float delayBetween,
                    const DropletOverrides& overrides = {});

    const DropletConfig& getSettings() const { return settings_.base(); }
    Result<void> updateSettings(const DropletOverrides& partial);
    void applyFilter(std::vector<SurfaceId> excluded);

    // Order: timers, casts, zero-delay timers, tweens, welds.
    void update(float deltaTime);

    // Starts decay on every landed pool now.
    void decayAll();

    // Cancels pending work, detaches listeners and frees every object.
    // Safe to call more than once.
    void destroy();
    bool isDestroyed() const { return destroyed_; }

    EngineStats stats() const;

    // Caster event handlers. Public so synthetic events can be injected.
    void onAdvancing(const CastSegment& segment);
    void onImpact(const CastImpact& impact);
    void onTerminated(const CastTerminated& terminated);

    const ObjectPool<DropletObject>& pool() const { return pool_; }
    const FlightRegistry& registry() const { return registry_; }
    const std::vector<DropletObject*>& liveObjects() const { return live_; }
    TimerQueue& timers() { return timers_; }
    TweenPlayer& tweens() { return tweens_; }

  private:
    struct DecayPlan {
        TimerId timer = kInvalidTimer;
        TweenInfo tween;
        bool scaleDown = true;
    };

    std::optional<Vec3f> resolveOrigin(const EmitOrigin& origin) const;
    Vec3f defaultDirection(const EmitOrigin& origin) const;
    DropletObject* acquireObject();

    void land(DropletObject& obj, const CastImpact& impact, const DropletConfig& config, const Quatf& rotation,
              const Vec3f& targetSize, float speed);
    void merge(DropletObject& obj, DropletObject& neighbor, const DropletConfig& config, const Vec3f& targetSize,
               float speed);
    void startDecay(DropletObject& obj);
    void recycle(DropletObject& obj);
    void syncWelds();
    void playCue(const std::string& slot, const std::vector<std::string>& names, const Vec3f& position);

    DropletSettings settings_;
    SurfaceWorld& world_;
    std::shared_ptr<EffectSink> effects_;
    RandomSource random_;
    SoundBank sounds_;

    EventDispatcher dispatcher_;
    TrajectoryCaster caster_;
    TimerQueue timers_;
    TweenPlayer tweens_;
    FlightRegistry registry_;

    ObjectId nextObjectId_ = 1;
    ObjectPool<DropletObject> pool_;
    std::vector<DropletObject*> live_;
    std::unordered_map<ObjectId, DecayPlan> decayPlans_;
    std::vector<std::pair<std::string, std::string>> listeners_;

    uint64_t emitted_ = 0;
    uint64_t dropped_ = 0;
    uint64_t merges_ = 0;
    uint64_t recycled_ = 0;
    bool destroyed_ = false;
};

} // namespace spill
