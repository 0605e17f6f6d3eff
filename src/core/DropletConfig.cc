#include "spill/core/DropletConfig.hh"

#include "spill/core/DataLoader.hh"
#include "spill/core/Log.hh"

#include <cmath>

namespace spill {

StringMap<TweenInfo> defaultTweens() {
    return {
        {kTweenLanded, TweenInfo{0.5f, EasingStyle::QuadOut}},
        {kTweenDecay, TweenInfo{1.0f, EasingStyle::Linear}},
        {kTweenExpand, TweenInfo{0.5f, EasingStyle::QuadOut}},
    };
}

TweenInfo DropletConfig::tween(const std::string& key) const {
    auto it = tweens.find(key);
    if (it != tweens.end()) {
        return it->second;
    }
    auto defaults = defaultTweens();
    auto fallback = defaults.find(key);
    return fallback != defaults.end() ? fallback->second : TweenInfo{};
}

bool DropletOverrides::empty() const {
    return !kind && !filter && !excludedSurfaces && !dropletDelay && !dropletVelocity && !randomOffset &&
           !offsetRange && !startingSize && !defaultSize && !poolThickness && !randomAngles && !expansion &&
           !mergeRadius && !maximumSize && !splashByVelocity && !velocityDivider && !splashAmount && !decayDelay &&
           !scaleDown && !poolTransparency && !dropletVisible && !trail && !color && !gravity && !maxDistance &&
           tweens.empty() && !sounds;
}

namespace {

template <typename T> void overlay(T& field, const std::optional<T>& value) {
    if (value) {
        field = *value;
    }
}

Result<void> checkRange(const NumberRange& range, const char* name, bool allowNegative) {
    if (!std::isfinite(range.min) || !std::isfinite(range.max)) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " must be finite");
    }
    if (range.min > range.max) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " has min greater than max");
    }
    if (!allowNegative && range.min < 0.0f) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " must not be negative");
    }
    return Result<void>::ok();
}

Result<void> checkPositive(float value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0f) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " must be positive");
    }
    return Result<void>::ok();
}

Result<void> checkNonNegative(float value, const char* name) {
    if (!std::isfinite(value) || value < 0.0f) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " must not be negative");
    }
    return Result<void>::ok();
}

} // namespace

DropletConfig applyOverrides(DropletConfig base, const DropletOverrides& overrides) {
    overlay(base.kind, overrides.kind);
    overlay(base.filter, overrides.filter);
    overlay(base.excludedSurfaces, overrides.excludedSurfaces);
    overlay(base.dropletDelay, overrides.dropletDelay);
    overlay(base.dropletVelocity, overrides.dropletVelocity);
    overlay(base.randomOffset, overrides.randomOffset);
    overlay(base.offsetRange, overrides.offsetRange);
    overlay(base.startingSize, overrides.startingSize);
    overlay(base.defaultSize, overrides.defaultSize);
    overlay(base.poolThickness, overrides.poolThickness);
    overlay(base.randomAngles, overrides.randomAngles);
    overlay(base.expansion, overrides.expansion);
    overlay(base.mergeRadius, overrides.mergeRadius);
    overlay(base.maximumSize, overrides.maximumSize);
    overlay(base.splashByVelocity, overrides.splashByVelocity);
    overlay(base.velocityDivider, overrides.velocityDivider);
    overlay(base.splashAmount, overrides.splashAmount);
    overlay(base.decayDelay, overrides.decayDelay);
    overlay(base.scaleDown, overrides.scaleDown);
    overlay(base.poolTransparency, overrides.poolTransparency);
    overlay(base.dropletVisible, overrides.dropletVisible);
    overlay(base.trail, overrides.trail);
    overlay(base.color, overrides.color);
    overlay(base.gravity, overrides.gravity);
    overlay(base.maxDistance, overrides.maxDistance);
    overlay(base.sounds, overrides.sounds);

    for (const auto& [key, info] : overrides.tweens) {
        base.tweens[key] = info;
    }
    return base;
}

Result<void> validate(const DropletConfig& config) {
    if (config.limit == 0) {
        return Result<void>::error(ErrorCode::InvalidArgument, "limit must be at least 1");
    }
    if (config.preallocate > config.limit) {
        return Result<void>::error(ErrorCode::InvalidArgument, "preallocate exceeds limit");
    }

    const std::pair<const NumberRange*, const char*> nonNegativeRanges[] = {
        {&config.dropletDelay, "droplet_delay"},     {&config.dropletVelocity, "droplet_velocity"},
        {&config.defaultSize, "default_size"},       {&config.splashAmount, "splash_amount"},
        {&config.decayDelay, "decay_delay"},
    };
    for (const auto& [range, name] : nonNegativeRanges) {
        auto r = checkRange(*range, name, false);
        if (r.isError())
            return r;
    }
    if (auto r = checkRange(config.offsetRange, "offset_range", true); r.isError())
        return r;

    if (!config.startingSize.isFinite() || config.startingSize.x < 0.0f || config.startingSize.y < 0.0f ||
        config.startingSize.z < 0.0f) {
        return Result<void>::error(ErrorCode::InvalidArgument, "starting_size must be finite and non-negative");
    }
    if (!config.gravity.isFinite()) {
        return Result<void>::error(ErrorCode::InvalidArgument, "gravity must be finite");
    }

    if (auto r = checkNonNegative(config.poolThickness, "pool_thickness"); r.isError())
        return r;
    if (auto r = checkNonNegative(config.mergeRadius, "merge_radius"); r.isError())
        return r;
    if (auto r = checkPositive(config.maximumSize, "maximum_size"); r.isError())
        return r;
    if (auto r = checkPositive(config.velocityDivider, "velocity_divider"); r.isError())
        return r;
    if (auto r = checkPositive(config.maxDistance, "max_distance"); r.isError())
        return r;

    if (!std::isfinite(config.poolTransparency) || config.poolTransparency < 0.0f || config.poolTransparency > 1.0f) {
        return Result<void>::error(ErrorCode::InvalidArgument, "pool_transparency must be within [0, 1]");
    }

    for (const auto& [key, info] : config.tweens) {
        if (!std::isfinite(info.duration) || info.duration < 0.0f) {
            return Result<void>::error(ErrorCode::InvalidArgument, "tween '" + key + "' has a negative duration");
        }
    }

    return Result<void>::ok();
}

// -- TOML presets --

namespace {

std::string keyOf(std::string_view table, std::string_view key) {
    std::string full(table);
    if (!full.empty()) {
        full += '.';
    }
    full += key;
    return full;
}

// NotFound means "not in the preset" and leaves the field unset.
Result<void> readBool(const DataLoader& loader, const std::string& key, std::optional<bool>& field) {
    auto r = loader.getBool(key);
    if (r.isOk()) {
        field = r.value();
    } else if (r.code() != ErrorCode::NotFound) {
        return Result<void>::error(r.code(), r.message());
    }
    return Result<void>::ok();
}

Result<void> readFloat(const DataLoader& loader, const std::string& key, std::optional<float>& field) {
    auto r = loader.getFloat(key);
    if (r.isOk()) {
        field = static_cast<float>(r.value());
    } else if (r.code() != ErrorCode::NotFound) {
        return Result<void>::error(r.code(), r.message());
    }
    return Result<void>::ok();
}

Result<void> readFloats(const DataLoader& loader, const std::string& key, size_t count, std::vector<double>& out,
                        bool& found) {
    found = false;
    auto r = loader.getFloatArray(key);
    if (r.isError()) {
        if (r.code() == ErrorCode::NotFound) {
            return Result<void>::ok();
        }
        return Result<void>::error(r.code(), r.message());
    }
    if (r.value().size() != count) {
        return Result<void>::error(ErrorCode::InvalidArgument,
                                   key + " expects " + std::to_string(count) + " numbers, got " +
                                       std::to_string(r.value().size()));
    }
    out = std::move(r.value());
    found = true;
    return Result<void>::ok();
}

Result<void> readRange(const DataLoader& loader, const std::string& key, std::optional<NumberRange>& field) {
    std::vector<double> values;
    bool found = false;
    if (auto r = readFloats(loader, key, 2, values, found); r.isError())
        return r;
    if (found) {
        field = NumberRange{static_cast<float>(values[0]), static_cast<float>(values[1])};
    }
    return Result<void>::ok();
}

Result<void> readVec3(const DataLoader& loader, const std::string& key, std::optional<Vec3f>& field) {
    std::vector<double> values;
    bool found = false;
    if (auto r = readFloats(loader, key, 3, values, found); r.isError())
        return r;
    if (found) {
        field = Vec3f(static_cast<float>(values[0]), static_cast<float>(values[1]), static_cast<float>(values[2]));
    }
    return Result<void>::ok();
}

Result<void> readStrings(const DataLoader& loader, const std::string& key, std::vector<std::string>& field,
                         bool& found) {
    auto r = loader.getStringArray(key);
    if (r.isOk()) {
        field = std::move(r.value());
        found = true;
    } else if (r.code() != ErrorCode::NotFound) {
        return Result<void>::error(r.code(), r.message());
    }
    return Result<void>::ok();
}

} // namespace

Result<DropletOverrides> loadDropletOverrides(const DataLoader& loader, std::string_view table) {
    using R = Result<DropletOverrides>;
    DropletOverrides out;

    if (!table.empty() && !loader.hasKey(table)) {
        return R::error(ErrorCode::NotFound, loader.sourceName() + ": no [" + std::string(table) + "] table");
    }

    auto kindName = loader.getString(keyOf(table, "kind"));
    if (kindName.isOk()) {
        out.kind = kindFromString(kindName.value());
        if (!out.kind) {
            return R::error(ErrorCode::InvalidArgument, "unknown droplet kind '" + kindName.value() + "'");
        }
    } else if (kindName.code() != ErrorCode::NotFound) {
        return R::error(kindName.code(), kindName.message());
    }

    const std::pair<const char*, std::optional<bool>*> bools[] = {
        {"filter", &out.filter},
        {"random_offset", &out.randomOffset},
        {"random_angles", &out.randomAngles},
        {"expansion", &out.expansion},
        {"splash_by_velocity", &out.splashByVelocity},
        {"scale_down", &out.scaleDown},
        {"droplet_visible", &out.dropletVisible},
        {"trail", &out.trail},
    };
    for (const auto& [key, field] : bools) {
        if (auto r = readBool(loader, keyOf(table, key), *field); r.isError())
            return R::error(r.code(), r.message());
    }

    const std::pair<const char*, std::optional<float>*> floats[] = {
        {"pool_thickness", &out.poolThickness},     {"merge_radius", &out.mergeRadius},
        {"maximum_size", &out.maximumSize},         {"velocity_divider", &out.velocityDivider},
        {"pool_transparency", &out.poolTransparency}, {"max_distance", &out.maxDistance},
    };
    for (const auto& [key, field] : floats) {
        if (auto r = readFloat(loader, keyOf(table, key), *field); r.isError())
            return R::error(r.code(), r.message());
    }

    const std::pair<const char*, std::optional<NumberRange>*> ranges[] = {
        {"droplet_delay", &out.dropletDelay}, {"droplet_velocity", &out.dropletVelocity},
        {"offset_range", &out.offsetRange},   {"default_size", &out.defaultSize},
        {"splash_amount", &out.splashAmount}, {"decay_delay", &out.decayDelay},
    };
    for (const auto& [key, field] : ranges) {
        if (auto r = readRange(loader, keyOf(table, key), *field); r.isError())
            return R::error(r.code(), r.message());
    }

    if (auto r = readVec3(loader, keyOf(table, "starting_size"), out.startingSize); r.isError())
        return R::error(r.code(), r.message());
    if (auto r = readVec3(loader, keyOf(table, "gravity"), out.gravity); r.isError())
        return R::error(r.code(), r.message());

    std::optional<Vec3f> rgb;
    if (auto r = readVec3(loader, keyOf(table, "color"), rgb); r.isError())
        return R::error(r.code(), r.message());
    if (rgb) {
        out.color = Color{rgb->x, rgb->y, rgb->z};
    }

    // [table.tweens.<name>] duration = 0.5, easing = "QuadOut"
    std::string tweensKey = keyOf(table, "tweens");
    if (const auto* node = loader.table().at_path(tweensKey).as_table()) {
        const auto defaults = defaultTweens();
        for (const auto& [name, _] : *node) {
            std::string tweenName(name.str());
            std::string entry = tweensKey + "." + tweenName;
            auto known = defaults.find(tweenName);
            TweenInfo info = known != defaults.end() ? known->second : TweenInfo{};
            auto duration = loader.getFloat(entry + ".duration");
            if (duration.isOk()) {
                info.duration = static_cast<float>(duration.value());
            } else if (duration.code() != ErrorCode::NotFound) {
                return R::error(duration.code(), duration.message());
            }
            auto easing = loader.getString(entry + ".easing");
            if (easing.isOk()) {
                auto style = easingFromString(easing.value());
                if (!style) {
                    return R::error(ErrorCode::InvalidArgument, "unknown easing '" + easing.value() + "'");
                }
                info.easing = *style;
            } else if (easing.code() != ErrorCode::NotFound) {
                return R::error(easing.code(), easing.message());
            }
            out.tweens[tweenName] = info;
        }
    }

    SoundSet sounds;
    bool anySound = false;
    if (auto r = readStrings(loader, keyOf(table, "sounds.start"), sounds.start, anySound); r.isError())
        return R::error(r.code(), r.message());
    if (auto r = readStrings(loader, keyOf(table, "sounds.impact"), sounds.impact, anySound); r.isError())
        return R::error(r.code(), r.message());
    if (auto r = readStrings(loader, keyOf(table, "sounds.expand"), sounds.expand, anySound); r.isError())
        return R::error(r.code(), r.message());
    if (anySound) {
        out.sounds = std::move(sounds);
    }

    return R::ok(std::move(out));
}

// -- DropletSettings --

DropletSettings::DropletSettings(DropletConfig base) : base_(std::move(base)) {
    auto result = validate(base_);
    if (result.isError()) {
        throwError("Invalid droplet configuration: " + result.message());
    }
}

Result<DropletConfig> DropletSettings::derive(const DropletOverrides& overrides) const {
    if (overrides.empty()) {
        return Result<DropletConfig>::ok(base_);
    }
    DropletConfig derived = applyOverrides(base_, overrides);
    auto result = validate(derived);
    if (result.isError()) {
        return Result<DropletConfig>::error(result.code(), result.message());
    }
    return Result<DropletConfig>::ok(std::move(derived));
}

Result<void> DropletSettings::update(const DropletOverrides& partial) {
    DropletConfig candidate = applyOverrides(base_, partial);
    auto result = validate(candidate);
    if (result.isError()) {
        SPILL_LOG_WARN("Rejected settings update: {}", result.message());
        return result;
    }
    base_ = std::move(candidate);
    return Result<void>::ok();
}

void DropletSettings::applyFilter(std::vector<SurfaceId> excluded) {
    base_.filter = true;
    base_.excludedSurfaces = std::move(excluded);
}

} // namespace spill
