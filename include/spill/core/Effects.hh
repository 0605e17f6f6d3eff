#pragma once

#include "spill/core/Spatial.hh"
#include "spill/utils/RandomSource.hh"
#include <string>
#include <unordered_map>
#include <vector>

namespace spill {

// Fire-and-forget presentation hooks. The engine never waits on them.
class EffectSink {
  public:
    virtual ~EffectSink() = default;

    virtual void playSound(const std::string& name, const Vec3f& position) = 0;
    virtual void emitParticles(const Vec3f& position, int count) = 0;
};

// Default sink for headless runs: writes every cue to the effects log channel.
class LogEffectSink : public EffectSink {
  public:
    void playSound(const std::string& name, const Vec3f& position) override;
    void emitParticles(const Vec3f& position, int count) override;
};

// Picks a random cue from a set, avoiding an immediate repeat per slot.
class SoundBank {
  public:
    explicit SoundBank(RandomSource& random) : random_(random) {}

    // Empty when the set is empty.
    std::string pick(const std::string& slot, const std::vector<std::string>& sounds);

    void reset() { lastPlayed_.clear(); }

  private:
    RandomSource& random_;
    std::unordered_map<std::string, std::string> lastPlayed_;
};

} // namespace spill
