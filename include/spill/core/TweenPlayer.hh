#pragma once

#include "spill/core/DropletObject.hh"
#include "spill/core/Spatial.hh"
#include "spill/core/Types.hh"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace spill {

enum class EasingStyle : uint8_t {
    Linear,
    QuadIn,
    QuadOut,
    QuadInOut,
    SineInOut
};

std::string easingToString(EasingStyle style);
std::optional<EasingStyle> easingFromString(std::string_view name);

// Maps linear progress t in [0, 1] onto the eased curve.
float applyEasing(EasingStyle style, float t);

struct TweenInfo {
    float duration = 0.5f;
    EasingStyle easing = EasingStyle::QuadOut;

    bool operator==(const TweenInfo& other) const { return duration == other.duration && easing == other.easing; }
};

// Properties a tween drives. Unset fields are left alone.
struct TweenGoal {
    std::optional<Vec3f> size;
    std::optional<float> transparency;
    std::optional<Quatf> rotation;
};

enum class TweenStatus : uint8_t {
    Completed,
    Cancelled
};

using TweenId = uint64_t;
constexpr TweenId kInvalidTween = 0;

// Per-object property animation. At most one tween runs per object: playing
// a new one cancels the previous. Completion callbacks run after the frame's
// property writes, so a callback may start new tweens or recycle its target.
class TweenPlayer {
  public:
    using Completion = std::function<void(TweenStatus)>;

    TweenPlayer() = default;

    TweenId play(DropletObject& target, const TweenInfo& info, const TweenGoal& goal, Completion onComplete = {});

    // Cancelling notifies the completion callback with Cancelled.
    bool cancel(TweenId id);
    bool cancelFor(const DropletObject& target);

    bool isPlaying(const DropletObject& target) const;
    // Goal of the tween still running on `target`, if any.
    std::optional<TweenGoal> pendingGoal(const DropletObject& target) const;
    size_t activeCount() const;

    // Zero-duration tweens finish on the first update after play().
    void update(float deltaTime);

    // Drops every tween without notifying.
    void clear();

    TweenPlayer(const TweenPlayer&) = delete;
    TweenPlayer& operator=(const TweenPlayer&) = delete;

  private:
    struct Tween {
        DropletObject* target = nullptr;
        TweenInfo info;
        TweenGoal goal;
        Vec3f startSize;
        float startTransparency = 0.0f;
        Quatf startRotation;
        float elapsed = 0.0f;
        Completion onComplete;
    };

    void apply(Tween& tween, float alpha);

    TweenId nextId_ = 1;
    std::map<TweenId, Tween> tweens_;
    std::unordered_map<ObjectId, TweenId> byTarget_;
};

} // namespace spill
