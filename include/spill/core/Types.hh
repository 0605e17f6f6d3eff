#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace spill {

template <typename T> using StringMap = std::map<std::string, T>;

template <typename T> using Optional = std::optional<T>;

// Identity of a pooled droplet object. 0 is never assigned.
using ObjectId = uint32_t;
constexpr ObjectId kInvalidObject = 0;

// Identity of a collidable surface. 0 is the handle-less ground plane.
using SurfaceId = uint32_t;
constexpr SurfaceId kNoSurface = 0;

} // namespace spill
