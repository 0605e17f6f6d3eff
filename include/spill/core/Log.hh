#pragma once

// Spill Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "spill/core/Log.hh"
//   SPILL_LOG_INFO("Engine constructed with limit {}", limit);
//   SPILL_DROPLET_DEBUG("Droplet {} landed", id);

// Neutralize X11 macro pollution. <X11/X.h> defines bare-word macros that
// collide with Quill's enum member names (e.g. Always, None, Never).
#ifdef Always
#undef Always
#endif
#ifdef None
#undef None
#endif
#ifdef Never
#undef Never
#endif
#ifdef Bool
#undef Bool
#endif
#ifdef Status
#undef Status
#endif
#ifdef Success
#undef Success
#endif
#ifdef True
#undef True
#endif
#ifdef False
#undef False
#endif

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace spill::log {

/// Initialize the logging subsystem (console + logs/ directory).
/// Call once at startup before any logging.
void init();

/// Initialize with an extra caller-provided file sink.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger. Valid after init().
quill::Logger* logger();

/// Subsystem loggers. Valid after init().
quill::Logger* dropletLogger();
quill::Logger* castLogger();
quill::Logger* effectsLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);
void setDropletLevel(quill::LogLevel level);
void setCastLevel(quill::LogLevel level);
void setEffectsLevel(quill::LogLevel level);

} // namespace spill::log

// Root logging macros.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define SPILL_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(spill::log::logger(), fmt, ##__VA_ARGS__)
#define SPILL_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(spill::log::logger(), fmt, ##__VA_ARGS__)
#define SPILL_LOG_INFO(fmt, ...) QUILL_LOG_INFO(spill::log::logger(), fmt, ##__VA_ARGS__)
#define SPILL_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(spill::log::logger(), fmt, ##__VA_ARGS__)
#define SPILL_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(spill::log::logger(), fmt, ##__VA_ARGS__)
#define SPILL_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(spill::log::logger(), fmt, ##__VA_ARGS__)

// Per-frame lifecycle chatter goes to subsystem channels so it can be muted
// independently of the root logger.
#define SPILL_DROPLET_DEBUG(fmt, ...) QUILL_LOG_DEBUG(spill::log::dropletLogger(), fmt, ##__VA_ARGS__)
#define SPILL_CAST_DEBUG(fmt, ...) QUILL_LOG_DEBUG(spill::log::castLogger(), fmt, ##__VA_ARGS__)
#define SPILL_EFFECTS_DEBUG(fmt, ...) QUILL_LOG_DEBUG(spill::log::effectsLogger(), fmt, ##__VA_ARGS__)
