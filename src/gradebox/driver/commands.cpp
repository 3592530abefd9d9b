#include "commands.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "gradebox/compiler/compiler.hpp"
#include "gradebox/config/engine_config.hpp"
#include "gradebox/evaluator/evaluator.hpp"
#include "gradebox/evaluator/grading_pool.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/evaluator/report_json.hpp"
#include "gradebox/sandbox/process_runner.hpp"
#include "gradebox/toolchain/toolchain.hpp"
#include "print.hpp"

namespace gradebox::driver {

namespace {

namespace fs = std::filesystem;

auto ReadFile(const fs::path& path) -> std::optional<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Explicit --config, else gradebox.toml found upward from the working
// directory, else built-in defaults. Throws ConfigError.
auto LoadEngineConfig(const std::optional<fs::path>& config_file)
    -> config::EngineConfig {
  if (config_file) {
    if (!fs::exists(*config_file)) {
      throw config::ConfigError(
          std::format("config file not found: {}", config_file->string()));
    }
    return config::LoadConfig(*config_file);
  }
  if (auto found = config::FindConfig()) {
    return config::LoadConfig(*found);
  }
  return config::DefaultConfig();
}

auto ExitStatus(evaluator::OutcomeKind kind) -> int {
  switch (kind) {
    case evaluator::OutcomeKind::kAccepted:
      return kExitAccepted;
    case evaluator::OutcomeKind::kCompilationFailure:
    case evaluator::OutcomeKind::kEvaluationFailure:
      return kExitRejected;
    case evaluator::OutcomeKind::kInternalError:
      return kExitInternalError;
  }
  return kExitInternalError;
}

}  // namespace

auto Grade(const GradeInput& input) -> int {
  config::EngineConfig config;
  try {
    config = LoadEngineConfig(input.config_file);
  } catch (const config::ConfigError& e) {
    PrintError(e.what());
    return kExitUsage;
  }

  auto source = ReadFile(input.source_file);
  if (!source) {
    PrintError(
        std::format("cannot read source file '{}'", input.source_file.string()));
    return kExitUsage;
  }

  std::string test_spec;
  if (input.tests_file) {
    auto text = ReadFile(*input.tests_file);
    if (!text) {
      PrintError(
          std::format(
              "cannot read test case file '{}'", input.tests_file->string()));
      return kExitUsage;
    }
    test_spec = std::move(*text);
  }

  compiler::GccCompiler compiler(config.toolchain);
  sandbox::SubprocessRunner runner(config.sandbox);
  evaluator::Evaluator engine(compiler, runner);

  auto result = engine.Evaluate(*source, test_spec);
  if (input.json) {
    fmt::print("{}\n", evaluator::ToJson(result).dump(2));
  } else {
    PrintReport(result);
  }
  return ExitStatus(evaluator::Classify(result));
}

auto Batch(const BatchInput& input) -> int {
  config::EngineConfig config;
  try {
    config = LoadEngineConfig(input.config_file);
  } catch (const config::ConfigError& e) {
    PrintError(e.what());
    return kExitUsage;
  }

  auto text = ReadFile(input.requests_file);
  if (!text) {
    PrintError(
        std::format(
            "cannot read request file '{}'", input.requests_file.string()));
    return kExitUsage;
  }
  auto requests = evaluator::ParseGradingRequests(*text);
  if (!requests) {
    PrintError(requests.error());
    return kExitUsage;
  }

  compiler::GccCompiler compiler(config.toolchain);
  sandbox::SubprocessRunner runner(config.sandbox);
  evaluator::Evaluator engine(compiler, runner);

  std::vector<std::string> ids;
  std::vector<std::future<Result<evaluator::EvaluationReport>>> pending;
  ids.reserve(requests->size());
  pending.reserve(requests->size());
  {
    evaluator::GradingPool pool(engine, config.workers);
    for (auto& request : *requests) {
      ids.push_back(request.id);
      pending.push_back(pool.Submit(std::move(request)));
    }
  }

  auto results = nlohmann::json::array();
  bool internal_error = false;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    auto result = pending[i].get();
    if (!result) {
      internal_error = true;
    }
    results.push_back(
        nlohmann::json{{"id", ids[i]}, {"report", evaluator::ToJson(result)}});
  }
  fmt::print("{}\n", results.dump(2));
  spdlog::info("batch: graded {} requests", pending.size());
  return internal_error ? kExitInternalError : kExitAccepted;
}

auto Check(const std::optional<fs::path>& config_file) -> int {
  config::EngineConfig config;
  try {
    config = LoadEngineConfig(config_file);
  } catch (const config::ConfigError& e) {
    PrintError(e.what());
    return kExitUsage;
  }

  auto status =
      toolchain::CheckToolchain(config.toolchain.compiler, config.scratch_root);
  PrintToolchainStatus(status);
  return status.ok ? kExitAccepted : kExitInternalError;
}

auto Init(bool force) -> int {
  fs::path config_path = fs::current_path() / config::kConfigFileName;
  if (fs::exists(config_path) && !force) {
    PrintError(
        std::format(
            "{} already exists (use --force to overwrite)",
            config::kConfigFileName));
    return kExitRejected;
  }

  std::ofstream out(config_path);
  out << config::DefaultConfigToml();
  if (!out.good()) {
    PrintError(std::format("cannot write {}", config_path.string()));
    return kExitRejected;
  }
  std::cout << std::format("Created {}\n", config_path.string());
  return kExitAccepted;
}

}  // namespace gradebox::driver
