#include "gradebox/config/engine_config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include "gradebox/common/scratch_directory.hpp"

namespace gradebox::config {

namespace fs = std::filesystem;

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

class TableReader {
 public:
  TableReader(std::string_view origin, std::string_view section)
      : origin_(origin), section_(section) {
  }

  // Reject keys not in `allowed`
  void ValidateKeys(
      const toml::table& table,
      std::initializer_list<std::string_view> allowed) const {
    for (const auto& [key, node] : table) {
      if (std::ranges::find(allowed, key.str()) == allowed.end()) {
        throw ConfigError(std::format(
            "{}:{}: unknown key '{}.{}'", origin_, node.source().begin.line,
            section_, key.str()));
      }
    }
  }

  [[nodiscard]] auto String(const toml::table& table, std::string_view key) const
      -> std::optional<std::string> {
    const auto* node = table.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    auto value = node->value<std::string>();
    if (!value) {
      throw Error(*node, key, "must be a string");
    }
    return value;
  }

  // Non-negative integer; `positive` additionally rejects zero
  [[nodiscard]] auto Integer(
      const toml::table& table, std::string_view key, bool positive) const
      -> std::optional<uint64_t> {
    const auto* node = table.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    auto value = node->value_exact<int64_t>();
    if (!value) {
      throw Error(*node, key, "must be an integer");
    }
    if (*value < 0 || (positive && *value == 0)) {
      throw Error(
          *node, key, positive ? "must be greater than zero" : "must not be negative");
    }
    return static_cast<uint64_t>(*value);
  }

  [[nodiscard]] auto StringArray(
      const toml::table& table, std::string_view key) const
      -> std::optional<std::vector<std::string>> {
    const auto* node = table.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    const auto* array = node->as_array();
    if (array == nullptr) {
      throw Error(*node, key, "must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& elem : *array) {
      auto str = elem.value<std::string>();
      if (!str) {
        throw Error(elem, key, "must be an array of strings");
      }
      values.push_back(*str);
    }
    return values;
  }

 private:
  [[nodiscard]] auto Error(
      const toml::node& node, std::string_view key, std::string_view what) const
      -> ConfigError {
    return ConfigError(std::format(
        "{}:{}: '{}.{}' {}", origin_, node.source().begin.line, section_, key,
        what));
  }

  std::string_view origin_;
  std::string_view section_;
};

auto SectionTable(
    const toml::table& root, std::string_view name, std::string_view origin)
    -> const toml::table* {
  const auto* node = root.get(name);
  if (node == nullptr) {
    return nullptr;
  }
  const auto* table = node->as_table();
  if (table == nullptr) {
    throw ConfigError(std::format(
        "{}:{}: '{}' must be a table", origin, node->source().begin.line,
        name));
  }
  return table;
}

void ApplyToolchain(
    const toml::table& table, std::string_view origin, EngineConfig& config) {
  TableReader reader(origin, "toolchain");
  reader.ValidateKeys(
      table, {"compiler", "standard", "flags", "source_extension",
              "compile_timeout_ms"});
  auto& options = config.toolchain;
  if (auto v = reader.String(table, "compiler")) {
    options.compiler = *v;
  }
  if (auto v = reader.String(table, "standard")) {
    options.standard = *v;
  }
  if (auto v = reader.StringArray(table, "flags")) {
    options.flags = *v;
  }
  if (auto v = reader.String(table, "source_extension")) {
    options.source_extension = *v;
  }
  if (auto v = reader.Integer(table, "compile_timeout_ms", true)) {
    options.compile_timeout = std::chrono::milliseconds(*v);
  }
}

void ApplySandbox(
    const toml::table& table, std::string_view origin, EngineConfig& config) {
  TableReader reader(origin, "sandbox");
  reader.ValidateKeys(
      table, {"execution_timeout_ms", "max_output_chars", "truncation_marker",
              "max_stderr_bytes", "memory_limit_mb", "cpu_time_limit_s",
              "max_file_size_mb"});
  auto& options = config.sandbox;
  if (auto v = reader.Integer(table, "execution_timeout_ms", true)) {
    options.execution_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = reader.Integer(table, "max_output_chars", true)) {
    options.max_output_chars = static_cast<std::size_t>(*v);
  }
  if (auto v = reader.String(table, "truncation_marker")) {
    options.truncation_marker = *v;
  }
  if (auto v = reader.Integer(table, "max_stderr_bytes", true)) {
    options.max_stderr_bytes = static_cast<std::size_t>(*v);
  }
  if (auto v = reader.Integer(table, "memory_limit_mb", false)) {
    options.limits.address_space_bytes = *v * kMiB;
  }
  if (auto v = reader.Integer(table, "cpu_time_limit_s", false)) {
    options.limits.cpu_seconds = *v;
  }
  if (auto v = reader.Integer(table, "max_file_size_mb", false)) {
    options.limits.file_size_bytes = *v * kMiB;
  }
}

void Apply(const toml::table& root, std::string_view origin, EngineConfig& config) {
  for (const auto& [key, node] : root) {
    auto name = key.str();
    if (name != "toolchain" && name != "sandbox" && name != "scratch" &&
        name != "pool") {
      throw ConfigError(std::format(
          "{}:{}: unknown section '{}'", origin, node.source().begin.line,
          name));
    }
  }

  if (const auto* table = SectionTable(root, "toolchain", origin)) {
    ApplyToolchain(*table, origin, config);
  }
  if (const auto* table = SectionTable(root, "sandbox", origin)) {
    ApplySandbox(*table, origin, config);
  }
  if (const auto* table = SectionTable(root, "scratch", origin)) {
    TableReader reader(origin, "scratch");
    reader.ValidateKeys(*table, {"root"});
    if (auto v = reader.String(*table, "root")) {
      config.scratch_root = *v;
    }
  }
  if (const auto* table = SectionTable(root, "pool", origin)) {
    TableReader reader(origin, "pool");
    reader.ValidateKeys(*table, {"workers"});
    if (auto v = reader.Integer(*table, "workers", true)) {
      config.workers = static_cast<std::size_t>(*v);
    }
  }

  config.toolchain.scratch_root = config.scratch_root;
}

}  // namespace

auto DefaultConfig() -> EngineConfig {
  EngineConfig config;
  config.scratch_root = common::DefaultScratchRoot();
  config.toolchain.scratch_root = config.scratch_root;
  config.workers = std::max(1U, std::thread::hardware_concurrency());
  return config;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view origin)
    -> EngineConfig {
  toml::table root;
  try {
    root = toml::parse(text, origin);
  } catch (const toml::parse_error& e) {
    throw ConfigError(std::format(
        "{}:{}: {}", origin, e.source().begin.line, e.description()));
  }

  auto config = DefaultConfig();
  Apply(root, origin, config);
  return config;
}

auto LoadConfig(const fs::path& config_path) -> EngineConfig {
  const std::string origin = config_path.string();
  toml::table root;
  try {
    root = toml::parse_file(origin);
  } catch (const toml::parse_error& e) {
    throw ConfigError(
        std::format("failed to parse {}: {}", origin, e.description()));
  }

  auto config = DefaultConfig();
  Apply(root, origin, config);
  // A relative [scratch] root is relative to the file that names it
  if (config.scratch_root.is_relative()) {
    config.scratch_root =
        fs::absolute(config_path).parent_path() / config.scratch_root;
    config.toolchain.scratch_root = config.scratch_root;
  }
  config.source_path = config_path;
  spdlog::debug("config: loaded {}", origin);
  return config;
}

auto DefaultConfigToml() -> std::string {
  return R"(# gradebox engine configuration

[toolchain]
compiler = "gcc"
standard = "c99"
flags = ["-Wall", "-Wextra"]
source_extension = ".c"
compile_timeout_ms = 10000

[sandbox]
execution_timeout_ms = 5000
max_output_chars = 10000
truncation_marker = "... (truncated)"
max_stderr_bytes = 65536
# Optional hardening, 0 = off
memory_limit_mb = 0
cpu_time_limit_s = 0
max_file_size_mb = 0

# [scratch]
# root = "/tmp/gradebox"  # relative to this file

# [pool]
# workers = 4
)";
}

}  // namespace gradebox::config
