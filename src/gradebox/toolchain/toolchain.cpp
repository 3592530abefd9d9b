#include "gradebox/toolchain/toolchain.hpp"

#include <chrono>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

#include "gradebox/common/scratch_directory.hpp"
#include "gradebox/common/subprocess.hpp"

namespace gradebox::toolchain {

namespace {

constexpr auto kVersionProbeTimeout = std::chrono::seconds(5);

auto IsExecutableFile(const std::filesystem::path& path) -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) &&
         access(path.c_str(), X_OK) == 0;
}

auto FirstLine(const std::string& text) -> std::string {
  auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

}  // namespace

auto FindExecutable(const std::string& name)
    -> std::optional<std::filesystem::path> {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (IsExecutableFile(name)) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  std::string_view search = path_env != nullptr ? path_env : "/usr/bin:/bin";
  while (!search.empty()) {
    auto sep = search.find(':');
    auto dir = search.substr(0, sep);
    search = sep == std::string_view::npos ? std::string_view{}
                                           : search.substr(sep + 1);
    // Empty PATH entry means the current directory
    auto candidate = (dir.empty() ? std::filesystem::current_path()
                                  : std::filesystem::path(dir)) /
                     name;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

auto CheckCompiler(const std::string& compiler)
    -> std::expected<ToolInfo, std::string> {
  auto path = FindExecutable(compiler);
  if (!path) {
    return std::unexpected(std::format("{} not found in PATH", compiler));
  }

  common::SubprocessOptions options;
  options.timeout = kVersionProbeTimeout;
  auto probe = common::RunSubprocess({path->string(), "--version"}, options);
  if (!probe) {
    return std::unexpected(
        std::format("cannot run {}: {}", compiler, probe.error()));
  }
  if (!probe->Succeeded()) {
    return std::unexpected(
        std::format("{} --version did not exit cleanly", compiler));
  }

  // Parse: "gcc (Ubuntu 11.4.0-1ubuntu1~22.04) 11.4.0" or
  // "clang version 18.0.0"
  std::regex version_regex(R"((\d+)\.(\d+)(?:\.(\d+))?)");
  std::smatch match;
  std::string version = "unknown";
  std::string first_line = FirstLine(probe->stdout_text);
  if (std::regex_search(first_line, match, version_regex)) {
    version = match[0].str();
  }

  return ToolInfo{.path = path->string(), .version = version};
}

auto CheckToolchain(
    const std::string& compiler, const std::filesystem::path& scratch_root)
    -> ToolchainStatus {
  ToolchainStatus status{.ok = true, .compiler = std::nullopt, .errors = {}};

  if (auto info = CheckCompiler(compiler); info) {
    status.compiler = *info;
  } else {
    status.ok = false;
    status.errors.push_back(info.error());
  }

  if (auto scratch = common::ScratchDirectory::Create(scratch_root, "probe");
      !scratch) {
    status.ok = false;
    status.errors.push_back(scratch.error().message);
  }

  return status;
}

}  // namespace gradebox::toolchain
