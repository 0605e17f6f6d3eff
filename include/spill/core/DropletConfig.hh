#pragma once

#include "spill/core/DropletObject.hh"
#include "spill/core/Spatial.hh"
#include "spill/core/TweenPlayer.hh"
#include "spill/core/Types.hh"
#include "spill/utils/ErrorHandling.hh"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spill {

class DataLoader;

// Sampled velocities are multiplied by this before firing.
constexpr float kVelocityScale = 10.0f;
// Lateral spawn jitter is sampled in centimetres.
constexpr float kOffsetScale = 0.01f;

// Tween keys used by the lifecycle.
inline constexpr const char* kTweenLanded = "landed";
inline constexpr const char* kTweenDecay = "decay";
inline constexpr const char* kTweenExpand = "expand";

struct NumberRange {
    float min = 0.0f;
    float max = 0.0f;

    bool operator==(const NumberRange& other) const { return min == other.min && max == other.max; }
};

// Cue names; one is picked at random per playback.
struct SoundSet {
    std::vector<std::string> start{"drip_start"};
    std::vector<std::string> impact{"splat_1", "splat_2", "splat_3"};
    std::vector<std::string> expand{"spread_1", "spread_2"};
};

StringMap<TweenInfo> defaultTweens();

// Every tunable of one emission. Copied by value per flight.
struct DropletConfig {
    DropletKind kind = DropletKind::Default;

    // Pool sizing is fixed when the engine is constructed.
    size_t limit = 500;
    size_t preallocate = 0;

    bool filter = false;
    std::vector<SurfaceId> excludedSurfaces;

    NumberRange dropletDelay{0.01f, 0.03f};
    NumberRange dropletVelocity{1.0f, 2.0f};
    bool randomOffset = true;
    NumberRange offsetRange{-20.0f, 10.0f};

    Vec3f startingSize{0.1f, 0.3f, 0.1f};
    NumberRange defaultSize{0.4f, 0.7f};
    float poolThickness = 0.05f;
    bool randomAngles = true;

    bool expansion = true;
    float mergeRadius = 0.2f;
    float maximumSize = 0.7f;

    bool splashByVelocity = true;
    float velocityDivider = 8.0f;
    NumberRange splashAmount{5.0f, 10.0f};

    NumberRange decayDelay{10.0f, 15.0f};
    bool scaleDown = true;
    float poolTransparency = 0.0f;

    bool dropletVisible = true;
    bool trail = true;
    Color color{0.45f, 0.02f, 0.02f};

    Vec3f gravity{0.0f, -50.0f, 0.0f};
    float maxDistance = 100.0f;

    StringMap<TweenInfo> tweens = defaultTweens();
    SoundSet sounds;

    // Falls back to the built-in timing when a key is missing.
    TweenInfo tween(const std::string& key) const;
};

// Per-field replacements. Set fields replace the base value wholesale,
// except `tweens`, which is merged key by key.
struct DropletOverrides {
    std::optional<DropletKind> kind;
    std::optional<bool> filter;
    std::optional<std::vector<SurfaceId>> excludedSurfaces;
    std::optional<NumberRange> dropletDelay;
    std::optional<NumberRange> dropletVelocity;
    std::optional<bool> randomOffset;
    std::optional<NumberRange> offsetRange;
    std::optional<Vec3f> startingSize;
    std::optional<NumberRange> defaultSize;
    std::optional<float> poolThickness;
    std::optional<bool> randomAngles;
    std::optional<bool> expansion;
    std::optional<float> mergeRadius;
    std::optional<float> maximumSize;
    std::optional<bool> splashByVelocity;
    std::optional<float> velocityDivider;
    std::optional<NumberRange> splashAmount;
    std::optional<NumberRange> decayDelay;
    std::optional<bool> scaleDown;
    std::optional<float> poolTransparency;
    std::optional<bool> dropletVisible;
    std::optional<bool> trail;
    std::optional<Color> color;
    std::optional<Vec3f> gravity;
    std::optional<float> maxDistance;
    StringMap<TweenInfo> tweens;
    std::optional<SoundSet> sounds;

    bool empty() const;
};

DropletConfig applyOverrides(DropletConfig base, const DropletOverrides& overrides);

// Range ordering, positivity and finiteness checks. InvalidArgument with the
// first offending field on failure.
Result<void> validate(const DropletConfig& config);

// Reads a [table] of snake_case keys from a TOML preset. Absent keys stay unset.
Result<DropletOverrides> loadDropletOverrides(const DataLoader& loader, std::string_view table);

// Owns the base configuration of one engine.
class DropletSettings {
  public:
    // Throws SpillException when the configuration is invalid.
    explicit DropletSettings(DropletConfig base);

    const DropletConfig& base() const { return base_; }

    // Snapshot for one emission: base with overrides applied.
    Result<DropletConfig> derive(const DropletOverrides& overrides) const;

    // Replaces the base with base+partial. The old base is kept on failure.
    Result<void> update(const DropletOverrides& partial);

    // Enables the collision filter with the given excluded surfaces.
    void applyFilter(std::vector<SurfaceId> excluded);

  private:
    DropletConfig base_;
};

} // namespace spill
