#pragma once

namespace gradebox::driver {

enum class Verbosity { kQuiet, kNormal, kVerbose };

// Route engine logs to stderr so stdout stays reserved for reports
void ConfigureLogging(Verbosity verbosity);

}  // namespace gradebox::driver
