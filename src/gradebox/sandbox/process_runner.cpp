#include "gradebox/sandbox/process_runner.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "gradebox/common/error.hpp"
#include "gradebox/common/subprocess.hpp"
#include "gradebox/compiler/artifact.hpp"

namespace gradebox::sandbox {

namespace {

auto IsUtf8Continuation(char c) -> bool {
  return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

}  // namespace

auto TruncateOutput(
    std::string output, std::size_t max_chars, std::string_view marker)
    -> std::string {
  if (output.size() <= max_chars) {
    return output;
  }
  std::size_t cut = max_chars;
  while (cut > 0 && IsUtf8Continuation(output[cut])) {
    --cut;
  }
  output.resize(cut);
  output += marker;
  return output;
}

SubprocessRunner::SubprocessRunner(SandboxOptions options)
    : options_(std::move(options)) {
}

auto SubprocessRunner::Run(
    const compiler::Artifact& artifact, std::string_view input)
    -> Result<ExecutionResult> {
  common::SubprocessOptions run_options;
  run_options.working_dir = artifact.Directory();
  run_options.stdin_data = std::string(input);
  run_options.timeout = options_.execution_timeout;
  // One byte past the cap is enough to know the output was longer
  run_options.max_stdout_bytes = options_.max_output_chars + 1;
  run_options.max_stderr_bytes = options_.max_stderr_bytes;
  run_options.limits = options_.limits;

  auto run = common::RunSubprocess({artifact.Executable().string()}, run_options);
  if (!run) {
    return std::unexpected(EngineError::Runtime(run.error()));
  }

  ExecutionResult result;
  result.timed_out = run->timed_out;
  result.exit_code = run->exited ? run->exit_code : -1;
  result.term_signal = run->signaled ? run->term_signal : 0;
  result.exited_normally = run->Succeeded();
  result.duration_ms = run->duration.count();
  result.truncated = run->stdout_text.size() > options_.max_output_chars;
  result.stdout_text = TruncateOutput(
      std::move(run->stdout_text), options_.max_output_chars,
      options_.truncation_marker);
  result.stderr_text = std::move(run->stderr_text);

  if (result.timed_out) {
    spdlog::warn(
        "sandbox: killed after {}ms (limit {}ms)", result.duration_ms,
        options_.execution_timeout.count());
  } else {
    spdlog::debug(
        "sandbox: exit_code={} signal={} stdout={}B{} in {}ms",
        result.exit_code, result.term_signal, result.stdout_text.size(),
        result.truncated ? " (truncated)" : "", result.duration_ms);
  }
  return result;
}

}  // namespace gradebox::sandbox
