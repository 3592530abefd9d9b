#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gradebox::common {

// POSIX resource limits applied in the child before exec. Zero means "leave
// the inherited limit alone".
struct ResourceLimits {
  uint64_t address_space_bytes = 0;
  uint64_t cpu_seconds = 0;
  uint64_t file_size_bytes = 0;

  [[nodiscard]] auto Any() const -> bool {
    return address_space_bytes != 0 || cpu_seconds != 0 ||
           file_size_bytes != 0;
  }
};

struct SubprocessOptions {
  std::optional<std::filesystem::path> working_dir;
  std::string stdin_data;
  // Wall-clock limit measured from spawn. Zero disables the limit.
  std::chrono::milliseconds timeout{0};
  // Per-stream capture caps in bytes. Zero means unlimited.
  std::size_t max_stdout_bytes = 0;
  std::size_t max_stderr_bytes = 0;
  ResourceLimits limits;
};

struct SubprocessResult {
  bool exited = false;  // WIFEXITED
  int exit_code = -1;   // Valid when exited
  bool signaled = false;
  int term_signal = 0;  // Valid when signaled
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] auto Succeeded() const -> bool {
    return exited && exit_code == 0 && !timed_out;
  }
};

// Execute argv (no shell interpretation) in a fresh process group.
// argv[0] is resolved through PATH. stdin_data is fed to the child while its
// output is drained. When the timeout expires the whole process group is
// killed; once the direct child exits, any descendants left in the group are
// killed as well.
// Returns an error message if the process could not be started (pipe, fork,
// or exec failure); a started process always yields a SubprocessResult.
auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options = {})
    -> std::expected<SubprocessResult, std::string>;

}  // namespace gradebox::common
