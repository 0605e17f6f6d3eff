#pragma once

// Spill Profiler Abstraction
// When SPILL_PROFILING_ENABLED is defined, these map to Tracy.
// Otherwise, they compile to nothing.

#ifdef SPILL_PROFILING_ENABLED
#include <tracy/Tracy.hpp>

#define SPILL_ZONE_SCOPED ZoneScoped
#define SPILL_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define SPILL_ZONE_VALUE(val) ZoneValue(val)

#define SPILL_FRAME_MARK FrameMark

#define SPILL_PLOT(name, val) TracyPlot(name, val)

#else
#define SPILL_ZONE_SCOPED
#define SPILL_ZONE_SCOPED_N(name)
#define SPILL_ZONE_VALUE(val)

#define SPILL_FRAME_MARK

#define SPILL_PLOT(name, val)
#endif
