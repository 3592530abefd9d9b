#include "gradebox/compiler/compiler.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "gradebox/common/error.hpp"
#include "gradebox/common/scratch_directory.hpp"
#include "gradebox/common/subprocess.hpp"
#include "gradebox/compiler/artifact.hpp"

namespace gradebox::compiler {

namespace {

constexpr std::string_view kCompilationTimeoutMessage = "Compilation timeout";

auto JoinArgs(const std::vector<std::string>& argv) -> std::string {
  std::string joined;
  for (const auto& arg : argv) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += arg;
  }
  return joined;
}

}  // namespace

auto CompilationResult::Failed(std::string diagnostics, bool timed_out)
    -> CompilationResult {
  return CompilationResult{
      .success = false,
      .artifact = std::nullopt,
      .diagnostics = std::move(diagnostics),
      .timed_out = timed_out,
  };
}

auto CompilationResult::Succeeded(Artifact artifact) -> CompilationResult {
  return CompilationResult{
      .success = true,
      .artifact = std::move(artifact),
      .diagnostics = {},
      .timed_out = false,
  };
}

GccCompiler::GccCompiler(ToolchainOptions options)
    : options_(std::move(options)) {
  if (options_.scratch_root.empty()) {
    options_.scratch_root = common::DefaultScratchRoot();
  }
}

auto GccCompiler::Compile(std::string_view source)
    -> Result<CompilationResult> {
  // Until the artifact is handed over, the scratch directory is ours and goes
  // away with this scope on every failure path.
  auto scratch = common::ScratchDirectory::Create(options_.scratch_root, "build");
  if (!scratch) {
    return std::unexpected(scratch.error());
  }

  auto source_path = scratch->Path() / ("submission" + options_.source_extension);
  auto artifact_path = scratch->Path() / "submission";

  {
    std::ofstream out(source_path, std::ios::binary);
    out << source;
    if (!out.good()) {
      return std::unexpected(EngineError::Internal(
          std::format("failed to write source file {}", source_path.string())));
    }
  }

  std::vector<std::string> argv = {options_.compiler,
                                   "-std=" + options_.standard};
  argv.insert(argv.end(), options_.flags.begin(), options_.flags.end());
  argv.insert(
      argv.end(), {"-o", artifact_path.string(), source_path.string()});

  common::SubprocessOptions run_options;
  run_options.working_dir = scratch->Path();
  run_options.timeout = options_.compile_timeout;
  run_options.max_stdout_bytes = options_.max_diagnostic_bytes;
  run_options.max_stderr_bytes = options_.max_diagnostic_bytes;

  spdlog::debug("compile: {}", JoinArgs(argv));
  auto run = common::RunSubprocess(argv, run_options);
  if (!run) {
    return std::unexpected(EngineError::Internal(
        std::format("toolchain unavailable: {}", run.error())));
  }

  if (run->timed_out) {
    spdlog::warn(
        "compile: timed out after {}ms", options_.compile_timeout.count());
    return CompilationResult::Failed(std::string(kCompilationTimeoutMessage), true);
  }

  if (!run->Succeeded()) {
    spdlog::debug(
        "compile: failed (exit {}, {} bytes of diagnostics)", run->exit_code,
        run->stderr_text.size());
    return CompilationResult::Failed(std::move(run->stderr_text));
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(artifact_path, ec)) {
    return std::unexpected(EngineError::Internal(
        std::format(
            "{} exited cleanly but produced no artifact at {}",
            options_.compiler, artifact_path.string())));
  }

  spdlog::debug("compile: ok in {}ms", run->duration.count());
  return CompilationResult::Succeeded(
      Artifact(std::move(*scratch), std::move(artifact_path)));
}

}  // namespace gradebox::compiler
