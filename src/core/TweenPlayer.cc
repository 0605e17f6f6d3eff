#include "spill/core/TweenPlayer.hh"

#include "spill/core/Log.hh"
#include "spill/utils/Profiler.hh"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>
#include <vector>

namespace spill {

std::string easingToString(EasingStyle style) {
    switch (style) {
        case EasingStyle::Linear:    return "Linear";
        case EasingStyle::QuadIn:    return "QuadIn";
        case EasingStyle::QuadOut:   return "QuadOut";
        case EasingStyle::QuadInOut: return "QuadInOut";
        case EasingStyle::SineInOut: return "SineInOut";
        default:                     return "Unknown";
    }
}

std::optional<EasingStyle> easingFromString(std::string_view name) {
    if (name == "Linear")
        return EasingStyle::Linear;
    if (name == "QuadIn")
        return EasingStyle::QuadIn;
    if (name == "QuadOut")
        return EasingStyle::QuadOut;
    if (name == "QuadInOut")
        return EasingStyle::QuadInOut;
    if (name == "SineInOut")
        return EasingStyle::SineInOut;
    return std::nullopt;
}

float applyEasing(EasingStyle style, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    switch (style) {
        case EasingStyle::QuadIn:
            return t * t;
        case EasingStyle::QuadOut:
            return t * (2.0f - t);
        case EasingStyle::QuadInOut:
            return t < 0.5f ? 2.0f * t * t : 1.0f - 2.0f * (1.0f - t) * (1.0f - t);
        case EasingStyle::SineInOut:
            return 0.5f * (1.0f - std::cos(std::numbers::pi_v<float> * t));
        case EasingStyle::Linear:
        default:
            return t;
    }
}

TweenId TweenPlayer::play(DropletObject& target, const TweenInfo& info, const TweenGoal& goal, Completion onComplete) {
    cancelFor(target);

    Tween tween;
    tween.target = &target;
    tween.info = info;
    tween.goal = goal;
    tween.startSize = target.size();
    tween.startTransparency = target.transparency();
    tween.startRotation = target.pose().getRotation();
    tween.onComplete = std::move(onComplete);

    TweenId id = nextId_++;
    tweens_.emplace(id, std::move(tween));
    byTarget_[target.id()] = id;
    return id;
}

bool TweenPlayer::cancel(TweenId id) {
    auto it = tweens_.find(id);
    if (it == tweens_.end()) {
        return false;
    }

    Completion onComplete = std::move(it->second.onComplete);
    byTarget_.erase(it->second.target->id());
    tweens_.erase(it);

    if (onComplete) {
        onComplete(TweenStatus::Cancelled);
    }
    return true;
}

bool TweenPlayer::cancelFor(const DropletObject& target) {
    auto it = byTarget_.find(target.id());
    if (it == byTarget_.end()) {
        return false;
    }
    return cancel(it->second);
}

bool TweenPlayer::isPlaying(const DropletObject& target) const {
    return byTarget_.count(target.id()) > 0;
}

std::optional<TweenGoal> TweenPlayer::pendingGoal(const DropletObject& target) const {
    auto it = byTarget_.find(target.id());
    if (it == byTarget_.end()) {
        return std::nullopt;
    }
    return tweens_.at(it->second).goal;
}

size_t TweenPlayer::activeCount() const {
    return tweens_.size();
}

void TweenPlayer::apply(Tween& tween, float alpha) {
    float eased = applyEasing(tween.info.easing, alpha);
    DropletObject& obj = *tween.target;

    if (tween.goal.size) {
        obj.setSize(Vec3f::lerp(tween.startSize, *tween.goal.size, eased));
    }
    if (tween.goal.transparency) {
        obj.setTransparency(tween.startTransparency + (*tween.goal.transparency - tween.startTransparency) * eased);
    }
    if (tween.goal.rotation) {
        obj.setRotation(Quatf::slerp(tween.startRotation, *tween.goal.rotation, eased).normalized());
    }
}

void TweenPlayer::update(float deltaTime) {
    SPILL_ZONE_SCOPED_N("TweenPlayer::update");

    std::vector<Completion> finished;

    for (auto it = tweens_.begin(); it != tweens_.end();) {
        Tween& tween = it->second;
        tween.elapsed += std::max(0.0f, deltaTime);

        float alpha = tween.info.duration <= 0.0f ? 1.0f : std::min(tween.elapsed / tween.info.duration, 1.0f);
        apply(tween, alpha);

        if (alpha >= 1.0f) {
            if (tween.onComplete) {
                finished.push_back(std::move(tween.onComplete));
            }
            byTarget_.erase(tween.target->id());
            it = tweens_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& onComplete : finished) {
        onComplete(TweenStatus::Completed);
    }
}

void TweenPlayer::clear() {
    if (!tweens_.empty()) {
        SPILL_LOG_DEBUG("TweenPlayer: dropping {} active tweens", tweens_.size());
    }
    tweens_.clear();
    byTarget_.clear();
}

} // namespace spill
