#pragma once

namespace verdict::driver {

// Install the "verdict" stderr logger as spdlog's default.
// 0 = warnings only, 1 = debug (lifecycle, argv, scratch paths), 2+ = trace.
void ConfigureLogging(int verbosity);

}  // namespace verdict::driver
