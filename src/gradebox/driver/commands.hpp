#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace gradebox::driver {

// Process exit statuses
inline constexpr int kExitAccepted = 0;
inline constexpr int kExitRejected = 1;
inline constexpr int kExitInternalError = 2;
inline constexpr int kExitUsage = 64;

struct GradeInput {
  std::filesystem::path source_file;
  std::optional<std::filesystem::path> tests_file;
  std::optional<std::filesystem::path> config_file;
  bool json = false;
};

struct BatchInput {
  std::filesystem::path requests_file;
  std::optional<std::filesystem::path> config_file;
};

auto Grade(const GradeInput& input) -> int;
auto Batch(const BatchInput& input) -> int;
auto Check(const std::optional<std::filesystem::path>& config_file) -> int;
auto Init(bool force) -> int;

}  // namespace gradebox::driver
