#include "spill/core/FlightRegistry.hh"

#include "spill/core/Log.hh"

namespace spill {

void FlightRegistry::registerFlight(ObjectId id, DropletConfig config) {
    auto result = entries_.insert_or_assign(id, std::move(config));
    if (!result.second) {
        SPILL_DROPLET_DEBUG("registry entry for object {} replaced", id);
    }
}

std::optional<DropletConfig> FlightRegistry::consume(ObjectId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    DropletConfig config = std::move(it->second);
    entries_.erase(it);
    return config;
}

} // namespace spill
