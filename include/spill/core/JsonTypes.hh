#pragma once

#include <nlohmann/json.hpp>
#include "spill/core/DropletConfig.hh"
#include "spill/core/DropletEngine.hh"
#include "spill/core/Spatial.hh"
#include "spill/utils/ErrorHandling.hh"

// ADL-visible to_json/from_json for Spill value types.
// Enables: nlohmann::json j = engine.stats(); auto o = j.get<DropletOverrides>();

namespace spill {

// --- Vector3 ---

template <typename T, typename SpaceTag>
void to_json(nlohmann::json& j, const Vector3<T, SpaceTag>& v) {
  j = nlohmann::json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

template <typename T, typename SpaceTag>
void from_json(const nlohmann::json& j, Vector3<T, SpaceTag>& v) {
  j.at("x").get_to(v.x);
  j.at("y").get_to(v.y);
  j.at("z").get_to(v.z);
}

// --- Quaternion ---

template <typename T>
void to_json(nlohmann::json& j, const Quaternion<T>& q) {
  j = nlohmann::json{{"x", q.x}, {"y", q.y}, {"z", q.z}, {"w", q.w}};
}

template <typename T>
void from_json(const nlohmann::json& j, Quaternion<T>& q) {
  j.at("x").get_to(q.x);
  j.at("y").get_to(q.y);
  j.at("z").get_to(q.z);
  j.at("w").get_to(q.w);
}

// --- NumberRange: [min, max] ---

inline void to_json(nlohmann::json& j, const NumberRange& r) {
  j = nlohmann::json::array({r.min, r.max});
}

inline void from_json(const nlohmann::json& j, NumberRange& r) {
  if (!j.is_array() || j.size() != 2) {
    throwError("NumberRange expects [min, max]");
  }
  j.at(0).get_to(r.min);
  j.at(1).get_to(r.max);
}

// --- Color ---

inline void to_json(nlohmann::json& j, const Color& c) {
  j = nlohmann::json{{"r", c.r}, {"g", c.g}, {"b", c.b}};
}

inline void from_json(const nlohmann::json& j, Color& c) {
  j.at("r").get_to(c.r);
  j.at("g").get_to(c.g);
  j.at("b").get_to(c.b);
}

// --- Enums as names ---

inline void to_json(nlohmann::json& j, const DropletKind& kind) {
  j = kindToString(kind);
}

inline void from_json(const nlohmann::json& j, DropletKind& kind) {
  auto parsed = kindFromString(j.get<std::string>());
  if (!parsed) {
    throwError("Unknown droplet kind: " + j.get<std::string>());
  }
  kind = *parsed;
}

inline void to_json(nlohmann::json& j, const EasingStyle& style) {
  j = easingToString(style);
}

inline void from_json(const nlohmann::json& j, EasingStyle& style) {
  auto parsed = easingFromString(j.get<std::string>());
  if (!parsed) {
    throwError("Unknown easing style: " + j.get<std::string>());
  }
  style = *parsed;
}

// --- TweenInfo ---

inline void to_json(nlohmann::json& j, const TweenInfo& info) {
  j = nlohmann::json{{"duration", info.duration}, {"easing", info.easing}};
}

// Missing fields keep their current value.
inline void from_json(const nlohmann::json& j, TweenInfo& info) {
  if (j.contains("duration"))
    j.at("duration").get_to(info.duration);
  if (j.contains("easing"))
    j.at("easing").get_to(info.easing);
}

// --- SoundSet ---

inline void to_json(nlohmann::json& j, const SoundSet& s) {
  j = nlohmann::json{{"start", s.start}, {"impact", s.impact}, {"expand", s.expand}};
}

inline void from_json(const nlohmann::json& j, SoundSet& s) {
  if (j.contains("start"))
    j.at("start").get_to(s.start);
  if (j.contains("impact"))
    j.at("impact").get_to(s.impact);
  if (j.contains("expand"))
    j.at("expand").get_to(s.expand);
}

// --- DropletConfig (dump only) ---

inline void to_json(nlohmann::json& j, const DropletConfig& c) {
  j = nlohmann::json{
      {"kind", c.kind},
      {"limit", c.limit},
      {"preallocate", c.preallocate},
      {"filter", c.filter},
      {"excluded_surfaces", c.excludedSurfaces},
      {"droplet_delay", c.dropletDelay},
      {"droplet_velocity", c.dropletVelocity},
      {"random_offset", c.randomOffset},
      {"offset_range", c.offsetRange},
      {"starting_size", c.startingSize},
      {"default_size", c.defaultSize},
      {"pool_thickness", c.poolThickness},
      {"random_angles", c.randomAngles},
      {"expansion", c.expansion},
      {"merge_radius", c.mergeRadius},
      {"maximum_size", c.maximumSize},
      {"splash_by_velocity", c.splashByVelocity},
      {"velocity_divider", c.velocityDivider},
      {"splash_amount", c.splashAmount},
      {"decay_delay", c.decayDelay},
      {"scale_down", c.scaleDown},
      {"pool_transparency", c.poolTransparency},
      {"droplet_visible", c.dropletVisible},
      {"trail", c.trail},
      {"color", c.color},
      {"gravity", c.gravity},
      {"max_distance", c.maxDistance},
      {"tweens", c.tweens},
      {"sounds", c.sounds},
  };
}

// --- DropletOverrides (partial) ---

namespace detail {

template <typename T>
void readOptional(const nlohmann::json& j, const char* key, std::optional<T>& field) {
  if (j.contains(key)) {
    field = j.at(key).get<T>();
  }
}

} // namespace detail

inline void from_json(const nlohmann::json& j, DropletOverrides& o) {
  detail::readOptional(j, "kind", o.kind);
  detail::readOptional(j, "filter", o.filter);
  detail::readOptional(j, "excluded_surfaces", o.excludedSurfaces);
  detail::readOptional(j, "droplet_delay", o.dropletDelay);
  detail::readOptional(j, "droplet_velocity", o.dropletVelocity);
  detail::readOptional(j, "random_offset", o.randomOffset);
  detail::readOptional(j, "offset_range", o.offsetRange);
  detail::readOptional(j, "starting_size", o.startingSize);
  detail::readOptional(j, "default_size", o.defaultSize);
  detail::readOptional(j, "pool_thickness", o.poolThickness);
  detail::readOptional(j, "random_angles", o.randomAngles);
  detail::readOptional(j, "expansion", o.expansion);
  detail::readOptional(j, "merge_radius", o.mergeRadius);
  detail::readOptional(j, "maximum_size", o.maximumSize);
  detail::readOptional(j, "splash_by_velocity", o.splashByVelocity);
  detail::readOptional(j, "velocity_divider", o.velocityDivider);
  detail::readOptional(j, "splash_amount", o.splashAmount);
  detail::readOptional(j, "decay_delay", o.decayDelay);
  detail::readOptional(j, "scale_down", o.scaleDown);
  detail::readOptional(j, "pool_transparency", o.poolTransparency);
  detail::readOptional(j, "droplet_visible", o.dropletVisible);
  detail::readOptional(j, "trail", o.trail);
  detail::readOptional(j, "color", o.color);
  detail::readOptional(j, "gravity", o.gravity);
  detail::readOptional(j, "max_distance", o.maxDistance);
  detail::readOptional(j, "sounds", o.sounds);

  if (j.contains("tweens")) {
    const auto defaults = defaultTweens();
    for (const auto& [name, value] : j.at("tweens").items()) {
      auto known = defaults.find(name);
      TweenInfo info = known != defaults.end() ? known->second : TweenInfo{};
      from_json(value, info);
      o.tweens[name] = info;
    }
  }
}

// --- EngineStats ---

inline void to_json(nlohmann::json& j, const EngineStats& s) {
  j = nlohmann::json{
      {"free", s.freeObjects},
      {"in_use", s.inUseObjects},
      {"created", s.createdObjects},
      {"in_flight", s.inFlight},
      {"landed", s.landed},
      {"registry", s.registrySize},
      {"emitted", s.emitted},
      {"dropped", s.droppedEmissions},
      {"merges", s.merges},
      {"recycled", s.recycled},
  };
}

} // namespace spill
