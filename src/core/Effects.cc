#include "spill/core/Effects.hh"

#include "spill/core/Log.hh"

namespace spill {

void LogEffectSink::playSound(const std::string& name, const Vec3f& position) {
    SPILL_EFFECTS_DEBUG("sound '{}' at ({:.2f}, {:.2f}, {:.2f})", name, position.x, position.y, position.z);
}

void LogEffectSink::emitParticles(const Vec3f& position, int count) {
    SPILL_EFFECTS_DEBUG("{} splash particles at ({:.2f}, {:.2f}, {:.2f})", count, position.x, position.y, position.z);
}

std::string SoundBank::pick(const std::string& slot, const std::vector<std::string>& sounds) {
    if (sounds.empty()) {
        return {};
    }

    if (sounds.size() == 1) {
        lastPlayed_[slot] = sounds[0];
        return sounds[0];
    }

    const std::string& last = lastPlayed_[slot];
    std::vector<size_t> candidates;
    candidates.reserve(sounds.size());
    for (size_t i = 0; i < sounds.size(); ++i) {
        if (sounds[i] != last) {
            candidates.push_back(i);
        }
    }

    // Every entry equals the last pick
    if (candidates.empty()) {
        lastPlayed_[slot] = sounds[0];
        return sounds[0];
    }

    size_t idx = candidates[random_.index(candidates.size())];
    lastPlayed_[slot] = sounds[idx];
    return sounds[idx];
}

} // namespace spill
