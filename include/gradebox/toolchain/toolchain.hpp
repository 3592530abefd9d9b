#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gradebox::toolchain {

struct ToolInfo {
  std::string path;
  std::string version;
};

struct ToolchainStatus {
  bool ok;
  std::optional<ToolInfo> compiler;
  std::vector<std::string> errors;
};

// Resolve an executable name through PATH (names containing '/' are checked
// as given). Returns nullopt if nothing executable is found.
auto FindExecutable(const std::string& name)
    -> std::optional<std::filesystem::path>;

// Check that `compiler` is installed and answers --version
auto CheckCompiler(const std::string& compiler)
    -> std::expected<ToolInfo, std::string>;

// Run all toolchain checks for a grading setup, return aggregated status
auto CheckToolchain(
    const std::string& compiler, const std::filesystem::path& scratch_root)
    -> ToolchainStatus;

}  // namespace gradebox::toolchain
