#include "spill/core/Constants.g.hh"
#include "spill/core/DataLoader.hh"
#include "spill/core/DropletEngine.hh"
#include "spill/core/JsonTypes.hh"
#include "spill/core/Log.hh"
#include "spill/core/SurfaceWorld.hh"
#include "spill/parser/ArgumentParser.hh"
#include "spill/utils/Profiler.hh"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr float kFrameTime = 1.0f / 60.0f;
constexpr int kFramesPerSecond = 60;
constexpr int kEmitInterval = 15;

// Reads [preset] from a TOML file into overrides on the built-in defaults.
std::optional<spill::DropletConfig> loadConfig(const std::string& path, const std::string& preset) {
    spill::DropletConfig config;
    if (path.empty()) {
        return config;
    }

    auto loader = spill::DataLoader::load(path);
    if (loader.isError()) {
        SPILL_LOG_ERROR("Cannot load {}: {}", path, loader.message());
        return std::nullopt;
    }

    auto overrides = spill::loadDropletOverrides(loader.value(), preset);
    if (overrides.isError()) {
        SPILL_LOG_ERROR("Invalid preset [{}] in {}: {}", preset, path, overrides.message());
        return std::nullopt;
    }
    return spill::applyOverrides(config, overrides.value());
}

} // namespace

int main(int argc, char* argv[]) {
    spill::log::init();
    SPILL_LOG_INFO("Starting {} {}", spill::APP_NAME, spill::APP_VERSION);

    spill::ArgumentParser argParser;
    argParser.addArgument("--version", "Display version information");
    argParser.addArgument("--help", "Display help information");
    argParser.addArgument("--config", "TOML preset file", true);
    argParser.addArgument("--preset", "Table to read from the preset file (default: droplet)", true);
    argParser.addArgument("--frames", "Frames to simulate at 60 Hz (default: 600)", true);
    argParser.addArgument("--emit", "Droplets per burst (default: 8)", true);
    argParser.addArgument("--overrides", "JSON object of per-burst overrides", true);
    argParser.addArgument("--seed", "Random seed", true);
    argParser.parse(argc, argv);

    if (argParser.hasArgument("--version")) {
        std::cout << spill::APP_NAME << " version " << spill::APP_VERSION << std::endl;
        spill::log::shutdown();
        return 0;
    }

    if (argParser.hasArgument("--help") || !argParser.errors().empty()) {
        for (const auto& error : argParser.errors()) {
            std::cerr << error << std::endl;
        }
        std::cout << argParser.usage(spill::APP_EXECUTABLE_NAME);
        spill::log::shutdown();
        return argParser.errors().empty() ? 0 : 1;
    }

    try {
        int frames = std::stoi(argParser.getArgument("--frames", "600"));
        int burst = std::stoi(argParser.getArgument("--emit", "8"));

        auto config = loadConfig(argParser.getArgument("--config"), argParser.getArgument("--preset", "droplet"));
        if (!config) {
            spill::log::shutdown();
            return 1;
        }

        spill::DropletOverrides overrides;
        if (argParser.hasArgument("--overrides")) {
            overrides = nlohmann::json::parse(argParser.getArgument("--overrides")).get<spill::DropletOverrides>();
        }

        std::optional<uint32_t> seed;
        if (argParser.hasArgument("--seed")) {
            seed = static_cast<uint32_t>(std::stoul(argParser.getArgument("--seed")));
        }

        // Floor plus a platform sliding back and forth
        spill::SurfaceWorld world;
        world.setGroundPlane(0.0f);
        spill::SurfaceId platform = world.addBox(
            spill::Transformf(spill::Vec3f(3.0f, 1.0f, 0.0f), spill::Quatf()), spill::Vec3f(1.5f, 0.25f, 1.5f), true);

        spill::DropletEngine engine(*config, world, nullptr, seed);
        SPILL_LOG_INFO("Simulating {} frames, {} droplets per burst", frames, burst);

        float time = 0.0f;
        for (int frame = 0; frame < frames; ++frame) {
            SPILL_ZONE_SCOPED_N("Frame");
            time += kFrameTime;

            world.setTransform(platform, spill::Transformf(spill::Vec3f(3.0f + 2.0f * std::sin(time), 1.0f, 0.0f),
                                                           spill::Quatf()));

            if (frame % kEmitInterval == 0) {
                engine.emitAmount(spill::EmitOrigin::world(spill::Vec3f(0.0f, 4.0f, 0.0f)),
                                  spill::Vec3f(0.4f, -0.2f, 0.0f), burst, -1.0f, overrides);
            }

            engine.update(kFrameTime);
            SPILL_FRAME_MARK;

            if ((frame + 1) % kFramesPerSecond == 0) {
                auto s = engine.stats();
                SPILL_LOG_INFO("t={:.1f}s in_use={} free={} in_flight={} landed={} merges={} dropped={}", time,
                               s.inUseObjects, s.freeObjects, s.inFlight, s.landed, s.merges, s.droppedEmissions);
            }
        }

        nlohmann::json report;
        report["stats"] = engine.stats();
        report["settings"] = engine.getSettings();
        std::cout << report.dump(2) << std::endl;

        engine.destroy();
        spill::log::shutdown();
        return 0;

    } catch (const std::exception& e) {
        SPILL_LOG_ERROR("Fatal: {}", e.what());
        spill::log::shutdown();
        return 1;
    }
}
