#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "logging.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddCommonFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--config")
      .help("Engine configuration (default: gradebox.toml found upward)")
      .metavar("file");
  cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log phases, commands and per-test results");
  cmd.add_argument("--quiet")
      .default_value(false)
      .implicit_value(true)
      .help("Only log warnings and errors");
}

auto OptionalPath(const argparse::ArgumentParser& cmd, const std::string& name)
    -> std::optional<fs::path> {
  if (auto value = cmd.present<std::string>(name)) {
    return fs::path(*value);
  }
  return std::nullopt;
}

auto SetupLogging(const argparse::ArgumentParser& cmd) -> bool {
  bool verbose = cmd.get<bool>("--verbose");
  bool quiet = cmd.get<bool>("--quiet");
  if (verbose && quiet) {
    gradebox::driver::PrintError("--verbose and --quiet are mutually exclusive");
    return false;
  }
  gradebox::driver::ConfigureLogging(
      verbose ? gradebox::driver::Verbosity::kVerbose
      : quiet ? gradebox::driver::Verbosity::kQuiet
              : gradebox::driver::Verbosity::kNormal);
  return true;
}

auto GradeCommand(const argparse::ArgumentParser& cmd) -> int {
  if (!SetupLogging(cmd)) {
    return gradebox::driver::kExitUsage;
  }
  gradebox::driver::GradeInput input{
      .source_file = cmd.get<std::string>("source"),
      .tests_file = OptionalPath(cmd, "--tests"),
      .config_file = OptionalPath(cmd, "--config"),
      .json = cmd.get<bool>("--json"),
  };
  return gradebox::driver::Grade(input);
}

auto BatchCommand(const argparse::ArgumentParser& cmd) -> int {
  if (!SetupLogging(cmd)) {
    return gradebox::driver::kExitUsage;
  }
  gradebox::driver::BatchInput input{
      .requests_file = cmd.get<std::string>("requests"),
      .config_file = OptionalPath(cmd, "--config"),
  };
  return gradebox::driver::Batch(input);
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  if (!SetupLogging(cmd)) {
    return gradebox::driver::kExitUsage;
  }
  return gradebox::driver::Check(OptionalPath(cmd, "--config"));
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  return gradebox::driver::Init(cmd.get<bool>("--force"));
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("gradebox", "0.1.0");
  program.add_description("Compile, run and grade learner submissions");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: grade
  argparse::ArgumentParser grade_cmd("grade");
  grade_cmd.add_description("Grade one submission against its test cases");
  grade_cmd.add_argument("source").help("Submission source file");
  grade_cmd.add_argument("--tests")
      .help("JSON test case file (default: implicit smoke test)")
      .metavar("file");
  grade_cmd.add_argument("--json")
      .default_value(false)
      .implicit_value(true)
      .help("Print the report as JSON");
  AddCommonFlags(grade_cmd);

  // Subcommand: batch
  argparse::ArgumentParser batch_cmd("batch");
  batch_cmd.add_description(
      "Grade a JSON array of {id, source, test_cases} requests");
  batch_cmd.add_argument("requests").help("Request file");
  AddCommonFlags(batch_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Check that the configured toolchain is usable");
  AddCommonFlags(check_cmd);

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Write a default gradebox.toml");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing gradebox.toml");

  program.add_subparser(grade_cmd);
  program.add_subparser(batch_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    gradebox::driver::PrintError(err.what());
    std::cerr << program;
    return gradebox::driver::kExitUsage;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      gradebox::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return gradebox::driver::kExitUsage;
    }
  }

  if (program.is_subcommand_used("grade")) {
    return GradeCommand(grade_cmd);
  }

  if (program.is_subcommand_used("batch")) {
    return BatchCommand(batch_cmd);
  }

  if (program.is_subcommand_used("check")) {
    return CheckCommand(check_cmd);
  }

  if (program.is_subcommand_used("init")) {
    return InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return gradebox::driver::kExitUsage;
}
