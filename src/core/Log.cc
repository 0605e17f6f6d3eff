#include "spill/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <string>
#include <vector>

namespace spill::log {

namespace {
// Root logger (all channels aggregated)
quill::Logger* g_logger = nullptr;

// Per-subsystem named loggers
quill::Logger* g_logger_droplet = nullptr;
quill::Logger* g_logger_cast = nullptr;
quill::Logger* g_logger_effects = nullptr;

const std::string kLogsDir = "logs";

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "SpillLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;
    quill::Backend::start(backend_opts);
}

// Root logs to console + spill.log, subsystem channels to console + session.log.
// extraSink (caller-provided file) is appended to every logger when present.
void createLoggers(const std::shared_ptr<quill::Sink>& extraSink) {
    std::filesystem::create_directories(kLogsDir);

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto spill_file = makeFileSink(kLogsDir + "/spill.log");
    auto session_file = makeFileSink(kLogsDir + "/session.log");
    auto pattern = makePattern();

    std::vector<std::shared_ptr<quill::Sink>> rootSinks{console_sink, spill_file};
    std::vector<std::shared_ptr<quill::Sink>> channelSinks{console_sink, session_file};
    if (extraSink) {
        rootSinks.push_back(extraSink);
        channelSinks.push_back(extraSink);
    }

    g_logger = quill::Frontend::create_or_get_logger("spill", rootSinks, pattern);
    g_logger_droplet = quill::Frontend::create_or_get_logger("droplet", channelSinks, pattern);
    g_logger_cast = quill::Frontend::create_or_get_logger("cast", channelSinks, pattern);
    g_logger_effects = quill::Frontend::create_or_get_logger("effects", channelSinks, pattern);

    for (auto* lg : {g_logger, g_logger_droplet, g_logger_cast, g_logger_effects}) {
        lg->set_log_level(quill::LogLevel::Info);
    }
}

} // namespace

void init() {
    startBackend();
    createLoggers(nullptr);
}

void init(const char* log_file_path) {
    startBackend();
    createLoggers(makeFileSink(log_file_path));
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_droplet, g_logger_cast, g_logger_effects}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* dropletLogger() {
    return g_logger_droplet;
}

quill::Logger* castLogger() {
    return g_logger_cast;
}

quill::Logger* effectsLogger() {
    return g_logger_effects;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

void setDropletLevel(quill::LogLevel level) {
    if (g_logger_droplet)
        g_logger_droplet->set_log_level(level);
}

void setCastLevel(quill::LogLevel level) {
    if (g_logger_cast)
        g_logger_cast->set_log_level(level);
}

void setEffectsLevel(quill::LogLevel level) {
    if (g_logger_effects)
        g_logger_effects->set_log_level(level);
}

} // namespace spill::log
