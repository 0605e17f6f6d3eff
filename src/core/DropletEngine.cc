#include "spill/core/DropletEngine.hh"

#include "spill/core/Log.hh"
#include "spill/core/NeighborQuery.hh"
#include "spill/utils/Profiler.hh"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace spill {

namespace {

// Splash compression per unit of impact speed, capped at a quarter of the pool.
constexpr float kCompressionPerSpeed = 0.01f;
constexpr float kMaxCompression = 0.25f;
// Share of the landing size a merge adds to the neighbor.
constexpr float kMergeContribution = 0.5f;

const Vec3f kWorldUp(0.0f, 1.0f, 0.0f);

DropletTemplate templateFor(const DropletConfig& config) {
    DropletTemplate tmpl;
    tmpl.size = config.startingSize;
    tmpl.transparency = 0.0f;
    tmpl.anchored = false;
    tmpl.splashAttachment = true;
    tmpl.trail = true;
    return tmpl;
}

// Local +Y onto the surface normal.
Quatf surfaceRotation(const Vec3f& normal) {
    Quatf tilt = Quatf::fromAxisAngle(Vec3f(1.0f, 0.0f, 0.0f), -std::numbers::pi_v<float> * 0.5f);
    return (Quatf::lookRotation(normal, kWorldUp) * tilt).normalized();
}

} // namespace

DropletEngine::DropletEngine(DropletConfig config, SurfaceWorld& world, std::shared_ptr<EffectSink> effects,
                             std::optional<uint32_t> seed)
    : settings_(std::move(config)),
      world_(world),
      effects_(effects ? std::move(effects) : std::make_shared<LogEffectSink>()),
      random_(seed ? RandomSource(*seed) : RandomSource()),
      sounds_(random_),
      caster_(world_, dispatcher_),
      pool_(settings_.base().limit, settings_.base().preallocate,
            [this, tmpl = templateFor(settings_.base())]() {
                return std::make_unique<DropletObject>(nextObjectId_++, tmpl);
            },
            [](DropletObject& obj) { obj.resetToTemplate(); }) {
    listeners_.emplace_back(kCastAdvancing,
                            dispatcher_.addEventListener(kCastAdvancing, [this](Event& event) {
                                onAdvancing(event.getPayload<CastSegment>());
                            }));
    listeners_.emplace_back(kCastImpact, dispatcher_.addEventListener(kCastImpact, [this](Event& event) {
                                onImpact(event.getPayload<CastImpact>());
                            }));
    listeners_.emplace_back(kCastTerminated,
                            dispatcher_.addEventListener(kCastTerminated, [this](Event& event) {
                                onTerminated(event.getPayload<CastTerminated>());
                            }));

    SPILL_LOG_INFO("DropletEngine created (limit={}, preallocated={}, kind={})", pool_.limit(),
                   pool_.totalCreated(), kindToString(settings_.base().kind));
}

DropletEngine::~DropletEngine() {
    destroy();
}

// -- Emission --

std::optional<Vec3f> DropletEngine::resolveOrigin(const EmitOrigin& origin) const {
    Vec3f point = origin.point;
    if (origin.surface) {
        const SurfaceBox* box = world_.find(*origin.surface);
        if (!box) {
            return std::nullopt;
        }
        point = box->pose.transformPoint(origin.point.as<Space::Local>());
    }
    if (!point.isFinite()) {
        return std::nullopt;
    }
    return point;
}

Vec3f DropletEngine::defaultDirection(const EmitOrigin& origin) const {
    if (origin.surface) {
        if (const SurfaceBox* box = world_.find(*origin.surface)) {
            return box->pose.upVector();
        }
    }
    return Vec3f(0.0f, -1.0f, 0.0f);
}

DropletObject* DropletEngine::acquireObject() {
    auto result = pool_.acquire();
    if (result.isError()) {
        ++dropped_;
        SPILL_DROPLET_DEBUG("emission dropped: {}", result.message());
        return nullptr;
    }
    return result.value();
}

bool DropletEngine::emit(const EmitOrigin& origin, std::optional<Vec3f> direction, const DropletOverrides& overrides) {
    SPILL_ZONE_SCOPED_N("DropletEngine::emit");
    if (destroyed_) {
        return false;
    }

    auto start = resolveOrigin(origin);
    if (!start) {
        SPILL_DROPLET_DEBUG("emission ignored: origin could not be resolved");
        return false;
    }

    auto derived = settings_.derive(overrides);
    if (derived.isError()) {
        SPILL_LOG_WARN("emission ignored: {}", derived.message());
        return false;
    }
    DropletConfig config = std::move(derived.value());

    Vec3f dir = direction ? *direction : defaultDirection(origin);
    if (config.randomOffset) {
        Vec3f jitter(random_.uniform(config.offsetRange.min, config.offsetRange.max),
                     random_.uniform(config.offsetRange.min, config.offsetRange.max),
                     random_.uniform(config.offsetRange.min, config.offsetRange.max));
        dir = dir.normalized() + jitter * kOffsetScale;
    }
    dir = dir.normalized();
    if (!dir.isFinite() || dir.lengthSquared() == 0.0f) {
        SPILL_DROPLET_DEBUG("emission ignored: degenerate direction");
        return false;
    }

    float speed = random_.uniform(config.dropletVelocity.min, config.dropletVelocity.max) * kVelocityScale;

    CastBehavior behavior;
    behavior.acceleration = config.gravity;
    behavior.maxDistance = config.maxDistance;
    if (config.filter) {
        behavior.filter.excluded = config.excludedSurfaces;
    }
    behavior.provider = [this]() { return acquireObject(); };

    auto handle = caster_.fire(*start, dir, speed, behavior);
    if (!handle) {
        return false;
    }

    DropletObject& obj = *handle->object;
    obj.setState(DropletState::Flying);
    obj.setKind(config.kind);
    obj.setColor(config.color);
    obj.setSize(config.startingSize);
    obj.setTransparency(config.dropletVisible ? 0.0f : 1.0f);
    obj.setVisible(config.dropletVisible);
    obj.setTrailEnabled(config.trail);
    obj.setAnchored(false);
    obj.setParented(true);
    obj.setPose(Transformf(*start, Quatf::lookRotation(dir, kWorldUp)));
    live_.push_back(&obj);

    playCue("start", config.sounds.start, *start);
    registry_.registerFlight(obj.id(), std::move(config));
    ++emitted_;

    SPILL_DROPLET_DEBUG("droplet {} emitted (cast {})", obj.id(), handle->id);
    return true;
}

void DropletEngine::emitAmount(const EmitOrigin& origin, std::optional<Vec3f> direction, int count,
                               float delayBetween, const DropletOverrides& overrides) {
    if (destroyed_ || count <= 0) {
        return;
    }

    NumberRange delayRange = settings_.base().dropletDelay;
    if (delayBetween < 0.0f) {
        auto derived = settings_.derive(overrides);
        if (derived.isError()) {
            SPILL_LOG_WARN("burst ignored: {}", derived.message());
            return;
        }
        delayRange = derived.value().dropletDelay;
    }

    emit(origin, direction, overrides);

    double at = 0.0;
    for (int i = 1; i < count; ++i) {
        at += delayBetween >= 0.0f ? delayBetween : random_.uniform(delayRange.min, delayRange.max);
        timers_.schedule(at, [this, origin, direction, overrides]() { emit(origin, direction, overrides); });
    }
}

Result<void> DropletEngine::updateSettings(const DropletOverrides& partial) {
    return settings_.update(partial);
}

void DropletEngine::applyFilter(std::vector<SurfaceId> excluded) {
    settings_.applyFilter(std::move(excluded));
}

// -- Caster events --

void DropletEngine::onAdvancing(const CastSegment& segment) {
    DropletObject* obj = segment.object;
    if (!obj || obj->state() != DropletState::Flying) {
        return;
    }

    // Keep the leading face on the ray tip
    float offset = segment.length - obj->size().z * 0.5f;
    Vec3f center = segment.origin + segment.direction * offset;
    obj->setPose(Transformf(center, Quatf::lookRotation(segment.direction, kWorldUp)));
}

void DropletEngine::onImpact(const CastImpact& impact) {
    SPILL_ZONE_SCOPED_N("DropletEngine::onImpact");
    DropletObject* obj = impact.object;
    if (!obj) {
        return;
    }

    auto snapshot = registry_.consume(obj->id());
    if (!snapshot) {
        SPILL_DROPLET_DEBUG("droplet {} has no flight entry, using base settings", obj->id());
    }
    const DropletConfig config = snapshot ? std::move(*snapshot) : settings_.base();

    if (obj->state() != DropletState::Flying) {
        SPILL_DROPLET_DEBUG("impact for droplet {} ignored in state {}", obj->id(), obj->stateName());
        return;
    }

    float speed = impact.velocity.length();

    Quatf rotation = surfaceRotation(impact.hit.normal);
    if (config.randomAngles && config.kind != DropletKind::Decal) {
        float yaw = random_.uniform(0.0f, 2.0f * std::numbers::pi_v<float>);
        rotation = (rotation * Quatf::fromAxisAngle(kWorldUp, yaw)).normalized();
    }

    float lateral = random_.uniform(config.defaultSize.min, config.defaultSize.max);
    float thickness = config.kind == DropletKind::Decal ? 0.0f : config.poolThickness;
    Vec3f targetSize(lateral, thickness, lateral);

    if (config.expansion) {
        if (DropletObject* neighbor = findNearestPool(live_, *obj, impact.hit.position, config.mergeRadius)) {
            merge(*obj, *neighbor, config, targetSize, speed);
            return;
        }
    }

    land(*obj, impact, config, rotation, targetSize, speed);
}

void DropletEngine::onTerminated(const CastTerminated& terminated) {
    DropletObject* obj = terminated.object;
    if (!obj) {
        return;
    }
    registry_.consume(obj->id());
    if (obj->state() == DropletState::Flying) {
        SPILL_DROPLET_DEBUG("droplet {} left range after {:.1f}", obj->id(), terminated.distance);
        recycle(*obj);
    }
}

// -- Transitions --

void DropletEngine::land(DropletObject& obj, const CastImpact& impact, const DropletConfig& config,
                         const Quatf& rotation, const Vec3f& targetSize, float speed) {
    obj.setState(DropletState::Landed);
    obj.setAnchored(true);
    obj.setVisible(true);
    obj.setTrailEnabled(false);
    obj.setPosition(impact.hit.position);

    TweenGoal goal;
    goal.size = targetSize;
    goal.transparency = config.poolTransparency;

    const SurfaceBox* surface = impact.hit.surface != kNoSurface ? world_.find(impact.hit.surface) : nullptr;
    if (surface && surface->movable) {
        // Rotation is applied now: weld sync rewrites the pose every frame
        obj.setRotation(rotation);
        obj.weldTo(surface->id, surface->pose.inverse() * obj.pose());
    } else {
        goal.rotation = rotation;
    }
    tweens_.play(obj, config.tween(kTweenLanded), goal);

    playCue("impact", config.sounds.impact, impact.hit.position);

    if (obj.hasSplashAttachment()) {
        int particles = config.splashByVelocity
                            ? static_cast<int>(std::ceil(speed / config.velocityDivider))
                            : random_.uniformInt(static_cast<int>(std::lround(config.splashAmount.min)),
                                                 static_cast<int>(std::lround(config.splashAmount.max)));
        if (particles > 0) {
            effects_->emitParticles(impact.hit.position, particles);
        }
    }

    DecayPlan plan;
    plan.tween = config.tween(kTweenDecay);
    plan.scaleDown = config.scaleDown;

    float delay = random_.uniform(config.decayDelay.min, config.decayDelay.max);
    uint32_t generation = obj.generation();
    DropletObject* target = &obj;
    plan.timer = timers_.schedule(delay, [this, target, generation]() {
        if (target->generation() == generation) {
            startDecay(*target);
        }
    });
    decayPlans_[obj.id()] = plan;

    SPILL_DROPLET_DEBUG("droplet {} landed on surface {}, decay in {:.2f}s", obj.id(), impact.hit.surface, delay);
}

void DropletEngine::merge(DropletObject& obj, DropletObject& neighbor, const DropletConfig& config,
                          const Vec3f& targetSize, float speed) {
    obj.setState(DropletState::Merging);
    neighbor.setState(DropletState::Expanding);

    // Fold a landing tween still in progress into the expansion goal
    TweenGoal goal;
    Vec3f current = neighbor.size();
    Vec3f settled = current;
    if (auto landing = tweens_.pendingGoal(neighbor)) {
        goal.rotation = landing->rotation;
        goal.transparency = landing->transparency;
        if (landing->size) {
            settled = *landing->size;
        }
    }

    float squash = speed * kCompressionPerSpeed;
    neighbor.setSize(Vec3f(current.x - std::min(squash, current.x * kMaxCompression), current.y,
                           current.z - std::min(squash, current.z * kMaxCompression)));

    Vec3f grown(std::min(settled.x + targetSize.x * kMergeContribution, config.maximumSize), settled.y,
                std::min(settled.z + targetSize.z * kMergeContribution, config.maximumSize));
    goal.size = grown;
    uint32_t generation = neighbor.generation();
    DropletObject* target = &neighbor;
    tweens_.play(neighbor, config.tween(kTweenExpand), goal, [target, generation](TweenStatus) {
        if (target->generation() == generation && target->state() == DropletState::Expanding) {
            target->setState(DropletState::Landed);
        }
    });

    playCue("expand", config.sounds.expand, neighbor.position());
    ++merges_;

    SPILL_DROPLET_DEBUG("droplet {} merged into pool {} ({:.2f} -> {:.2f})", obj.id(), neighbor.id(), current.x,
                        grown.x);
    recycle(obj);
}

void DropletEngine::startDecay(DropletObject& obj) {
    DropletState state = obj.state();
    if (state != DropletState::Landed && state != DropletState::Expanding) {
        return;
    }

    DecayPlan plan;
    auto it = decayPlans_.find(obj.id());
    if (it != decayPlans_.end()) {
        plan = it->second;
        timers_.cancel(plan.timer);
        decayPlans_.erase(it);
    } else {
        plan.tween = settings_.base().tween(kTweenDecay);
        plan.scaleDown = settings_.base().scaleDown;
    }

    obj.setState(DropletState::Decaying);

    TweenGoal goal;
    goal.size = plan.scaleDown ? Vec3f(0.0f, 0.0f, 0.0f) : obj.size();
    goal.transparency = 1.0f;

    uint32_t generation = obj.generation();
    DropletObject* target = &obj;
    tweens_.play(obj, plan.tween, goal, [this, target, generation](TweenStatus status) {
        if (status != TweenStatus::Completed || target->generation() != generation) {
            return;
        }
        if (target->state() == DropletState::Decaying) {
            recycle(*target);
        }
    });

    SPILL_DROPLET_DEBUG("droplet {} decaying", obj.id());
}

void DropletEngine::recycle(DropletObject& obj) {
    if (obj.state() == DropletState::Pooled) {
        return;
    }

    tweens_.cancelFor(obj);

    auto plan = decayPlans_.find(obj.id());
    if (plan != decayPlans_.end()) {
        timers_.cancel(plan->second.timer);
        decayPlans_.erase(plan);
    }
    registry_.consume(obj.id());
    live_.erase(std::remove(live_.begin(), live_.end(), &obj), live_.end());

    if (!obj.tryTransition(DropletState::Pooled)) {
        SPILL_LOG_WARN("droplet {} recycled from state {}", obj.id(), obj.stateName());
    }

    ObjectId id = obj.id();
    if (pool_.release(&obj)) {
        ++recycled_;
        SPILL_DROPLET_DEBUG("droplet {} returned to pool", id);
    }
}

void DropletEngine::decayAll() {
    if (destroyed_) {
        return;
    }
    std::vector<DropletObject*> landed;
    for (DropletObject* obj : live_) {
        if (obj->state() == DropletState::Landed || obj->state() == DropletState::Expanding) {
            landed.push_back(obj);
        }
    }
    for (DropletObject* obj : landed) {
        startDecay(*obj);
    }
}

// -- Frame --

void DropletEngine::update(float deltaTime) {
    SPILL_ZONE_SCOPED_N("DropletEngine::update");
    if (destroyed_) {
        return;
    }

    timers_.advance(deltaTime);
    caster_.update(deltaTime);
    timers_.advance(0.0);
    tweens_.update(deltaTime);
    syncWelds();
}

void DropletEngine::syncWelds() {
    for (DropletObject* obj : live_) {
        const auto& weld = obj->weld();
        if (!weld) {
            continue;
        }
        const SurfaceBox* surface = world_.find(weld->surface);
        if (!surface) {
            SPILL_DROPLET_DEBUG("droplet {} lost its surface {}", obj->id(), weld->surface);
            obj->clearWeld();
            continue;
        }
        obj->setPose(surface->pose * weld->offset);
    }
}

void DropletEngine::playCue(const std::string& slot, const std::vector<std::string>& names, const Vec3f& position) {
    std::string name = sounds_.pick(slot, names);
    if (!name.empty()) {
        effects_->playSound(name, position);
    }
}

// -- Teardown --

void DropletEngine::destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;

    for (const auto& [type, id] : listeners_) {
        dispatcher_.removeEventListener(type, id);
    }
    listeners_.clear();

    timers_.clear();
    tweens_.clear();
    caster_.clear();
    registry_.clear();
    decayPlans_.clear();
    live_.clear();

    SPILL_LOG_INFO("DropletEngine destroyed ({} emitted, {} dropped, {} merges, {} objects freed)", emitted_,
                   dropped_, merges_, pool_.totalCreated());
    pool_.clear();
}

EngineStats DropletEngine::stats() const {
    EngineStats s;
    s.freeObjects = pool_.freeCount();
    s.inUseObjects = pool_.inUseCount();
    s.createdObjects = pool_.totalCreated();
    s.inFlight = caster_.activeCount();
    s.registrySize = registry_.size();
    s.emitted = emitted_;
    s.droppedEmissions = dropped_;
    s.merges = merges_;
    s.recycled = recycled_;
    for (const DropletObject* obj : live_) {
        DropletState state = obj->state();
        if (state == DropletState::Landed || state == DropletState::Expanding || state == DropletState::Decaying) {
            ++s.landed;
        }
    }
    return s;
}

} // namespace spill
