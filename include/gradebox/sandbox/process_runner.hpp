#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "gradebox/common/error.hpp"
#include "gradebox/common/subprocess.hpp"
#include "gradebox/compiler/artifact.hpp"

namespace gradebox::sandbox {

inline constexpr std::string_view kDefaultTruncationMarker = "... (truncated)";

struct ExecutionResult {
  // Exited on its own with status 0
  bool exited_normally = false;
  int exit_code = -1;   // -1 when the process did not exit
  int term_signal = 0;  // Nonzero when killed by a signal
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool truncated = false;
  int64_t duration_ms = 0;
};

// Runs a compiled artifact once per call. Implementations must bound the
// wall-clock time of every run and never hang the caller. The error channel
// reports faults of the sandbox itself (the run never started).
class ProcessRunner {
 public:
  ProcessRunner() = default;
  virtual ~ProcessRunner() = default;

  ProcessRunner(const ProcessRunner&) = delete;
  auto operator=(const ProcessRunner&) -> ProcessRunner& = delete;
  ProcessRunner(ProcessRunner&&) = delete;
  auto operator=(ProcessRunner&&) -> ProcessRunner& = delete;

  virtual auto Run(const compiler::Artifact& artifact, std::string_view input)
      -> Result<ExecutionResult> = 0;
};

struct SandboxOptions {
  std::chrono::milliseconds execution_timeout{5'000};
  std::size_t max_output_chars = 10'000;
  std::string truncation_marker = std::string(kDefaultTruncationMarker);
  std::size_t max_stderr_bytes = 64 * 1024;
  // Optional hardening; all zero by default
  common::ResourceLimits limits;
};

// Cap `output` at `max_chars` bytes without splitting a UTF-8 sequence and
// append `marker`. Returns the output unchanged if it fits.
auto TruncateOutput(
    std::string output, std::size_t max_chars, std::string_view marker)
    -> std::string;

// Launches the artifact as a child process in its own process group, feeds
// `input` on stdin and captures stdout/stderr under SandboxOptions.
class SubprocessRunner final : public ProcessRunner {
 public:
  explicit SubprocessRunner(SandboxOptions options);

  auto Run(const compiler::Artifact& artifact, std::string_view input)
      -> Result<ExecutionResult> override;

  [[nodiscard]] auto Options() const -> const SandboxOptions& {
    return options_;
  }

 private:
  SandboxOptions options_;
};

}  // namespace gradebox::sandbox
