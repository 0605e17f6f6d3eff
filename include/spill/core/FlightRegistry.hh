#pragma once

#include "spill/core/DropletConfig.hh"
#include "spill/core/Types.hh"
#include <optional>
#include <unordered_map>

namespace spill {

// Maps each in-flight object to the snapshot it was emitted with.
// An entry is read exactly once: consume() removes it.
class FlightRegistry {
  public:
    // Replaces any previous entry for the object.
    void registerFlight(ObjectId id, DropletConfig config);

    std::optional<DropletConfig> consume(ObjectId id);

    bool contains(ObjectId id) const { return entries_.count(id) > 0; }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

  private:
    std::unordered_map<ObjectId, DropletConfig> entries_;
};

} // namespace spill
