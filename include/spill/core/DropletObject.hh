#pragma once

#include "spill/core/Spatial.hh"
#include "spill/core/StateMachine.hh"
#include "spill/core/Types.hh"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spill {

// Visual variant: a volume pool, or a flush decal with no thickness.
enum class DropletKind : uint8_t {
    Default,
    Decal
};

std::string kindToString(DropletKind kind);
std::optional<DropletKind> kindFromString(std::string_view name);

// Pooled is the free/recycled state. Flying is entered on emission.
enum class DropletState : uint8_t {
    Pooled,
    Flying,
    Landed,
    Merging,
    Expanding,
    Decaying
};

struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;

    bool operator==(const Color& other) const { return r == other.r && g == other.g && b == other.b; }
};

// Rigid attachment to a movable surface. The pose follows surface * offset.
struct Weld {
    SurfaceId surface = kNoSurface;
    Transformf offset;
};

// Values restored on every recycle.
struct DropletTemplate {
    Vec3f size{0.1f, 0.3f, 0.1f};
    float transparency = 0.0f;
    bool anchored = false;
    bool splashAttachment = true;
    bool trail = true;
};

class DropletObject {
  public:
    DropletObject(ObjectId id, const DropletTemplate& tmpl);

    static std::string stateToString(DropletState state);

    ObjectId id() const { return id_; }

    const Transformf& pose() const { return pose_; }
    void setPose(const Transformf& pose) { pose_ = pose; }
    Vec3f position() const { return pose_.getPosition(); }
    void setPosition(const Vec3f& position) { pose_.setPosition(position); }
    void setRotation(const Quatf& rotation) { pose_.setRotation(rotation); }

    const Vec3f& size() const { return size_; }
    void setSize(const Vec3f& size) { size_ = size; }

    float transparency() const { return transparency_; }
    void setTransparency(float transparency) { transparency_ = transparency; }

    bool visible() const { return visible_; }
    void setVisible(bool visible) { visible_ = visible; }

    DropletKind kind() const { return kind_; }
    void setKind(DropletKind kind) { kind_ = kind; }

    const Color& color() const { return color_; }
    void setColor(const Color& color) { color_ = color; }

    bool anchored() const { return anchored_; }
    void setAnchored(bool anchored) { anchored_ = anchored; }

    // Parented objects are live in the scene and visible to neighbor scans.
    bool parented() const { return parented_; }
    void setParented(bool parented) { parented_ = parented; }

    const std::optional<Weld>& weld() const { return weld_; }
    void weldTo(SurfaceId surface, const Transformf& offset) { weld_ = Weld{surface, offset}; }
    void clearWeld() { weld_.reset(); }

    bool hasSplashAttachment() const { return template_.splashAttachment; }
    bool hasTrail() const { return template_.trail; }
    bool trailEnabled() const { return trailEnabled_; }
    void setTrailEnabled(bool enabled) { trailEnabled_ = enabled && template_.trail; }

    const DropletTemplate& defaults() const { return template_; }

    // Bumped on every recycle so deferred work can detect a reused object.
    uint32_t generation() const { return generation_; }

    DropletState state() const { return state_.getState(); }
    std::string stateName() const { return state_.stateName(); }

    // Throws on a transition the lifecycle does not allow.
    void setState(DropletState state) { state_.setState(state); }
    bool tryTransition(DropletState state) { return state_.tryTransition(state); }

    bool isDecaying() const { return state() == DropletState::Decaying; }
    bool isExpanding() const { return state() == DropletState::Expanding; }

    // Restores template values, drops any weld and returns to Pooled.
    void resetToTemplate();

    static std::shared_ptr<const TransitionTable<DropletState>> transitionTable();

  private:
    ObjectId id_;
    DropletTemplate template_;
    Transformf pose_;
    Vec3f size_;
    float transparency_;
    bool visible_ = false;
    DropletKind kind_ = DropletKind::Default;
    Color color_;
    bool anchored_;
    bool parented_ = false;
    bool trailEnabled_ = false;
    std::optional<Weld> weld_;
    uint32_t generation_ = 0;
    StateMachine<DropletState> state_;
};

} // namespace spill
