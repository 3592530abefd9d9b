#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "gradebox/compiler/compiler.hpp"
#include "gradebox/sandbox/process_runner.hpp"

namespace gradebox::config {

inline constexpr std::string_view kConfigFileName = "gradebox.toml";

// Malformed or invalid gradebox.toml
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct EngineConfig {
  compiler::ToolchainOptions toolchain;
  sandbox::SandboxOptions sandbox;
  std::filesystem::path scratch_root;
  std::size_t workers = 1;

  // File the values were read from; empty for built-in defaults
  std::filesystem::path source_path;
};

// Built-in defaults: gcc -std=c99 -Wall -Wextra, 10s compile, 5s execution,
// 10000 output characters, scratch under <temp>/gradebox, one worker per
// hardware thread.
auto DefaultConfig() -> EngineConfig;

// Search for gradebox.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a gradebox.toml file on top of DefaultConfig(). Every section and
// key is optional; unknown keys and out-of-range values throw ConfigError.
// A relative [scratch] root is resolved against the file's directory.
auto LoadConfig(const std::filesystem::path& config_path) -> EngineConfig;

// Parse gradebox.toml text. `origin` names the source in error messages.
auto ParseConfig(std::string_view text, std::string_view origin = "<string>")
    -> EngineConfig;

// Contents written by `gradebox init`
auto DefaultConfigToml() -> std::string;

}  // namespace gradebox::config
