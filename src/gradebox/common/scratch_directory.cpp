#include "gradebox/common/scratch_directory.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <unistd.h>

#include "gradebox/common/error.hpp"

namespace gradebox::common {

namespace {

constexpr int kMaxCreateAttempts = 16;

auto NextNonce() -> uint32_t {
  thread_local std::mt19937 gen(
      std::random_device{}() ^
      static_cast<uint32_t>(
          std::chrono::steady_clock::now().time_since_epoch().count()));
  return gen();
}

}  // namespace

auto DefaultScratchRoot() -> std::filesystem::path {
  return std::filesystem::temp_directory_path() / "gradebox";
}

auto ScratchDirectory::Create(
    const std::filesystem::path& root, std::string_view prefix)
    -> Result<ScratchDirectory> {
  static std::atomic<uint64_t> counter{0};

  // Children run with the scratch directory as cwd, so every path handed to
  // them must be absolute.
  std::error_code ec;
  auto absolute_root = std::filesystem::absolute(root, ec);
  if (ec) {
    return std::unexpected(EngineError::Internal(
        std::format(
            "cannot resolve scratch root '{}': {}", root.string(),
            ec.message())));
  }
  std::filesystem::create_directories(absolute_root, ec);
  if (ec) {
    return std::unexpected(EngineError::Internal(
        std::format(
            "cannot create scratch root '{}': {}", absolute_root.string(),
            ec.message())));
  }

  for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
    auto leaf = std::format(
        "{}-{}-{}-{:08x}", prefix, getpid(), counter.fetch_add(1),
        NextNonce());
    auto path = absolute_root / leaf;
    // create_directory reports false without error when the leaf exists
    bool created = std::filesystem::create_directory(path, ec);
    if (ec) {
      return std::unexpected(EngineError::Internal(
          std::format(
              "cannot create scratch directory '{}': {}", path.string(),
              ec.message())));
    }
    if (created) {
      spdlog::debug("scratch: created {}", path.string());
      return ScratchDirectory(std::move(path));
    }
  }

  return std::unexpected(EngineError::Internal(
      std::format(
          "cannot allocate a unique scratch directory under '{}'",
          absolute_root.string())));
}

ScratchDirectory::ScratchDirectory(std::filesystem::path path)
    : path_(std::move(path)) {
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::exchange(other.path_, {})) {
}

auto ScratchDirectory::operator=(ScratchDirectory&& other) noexcept
    -> ScratchDirectory& {
  if (this != &other) {
    Cleanup();
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

ScratchDirectory::~ScratchDirectory() noexcept {
  Cleanup();
}

void ScratchDirectory::Cleanup() noexcept {
  if (path_.empty()) {
    return;
  }
  if (std::getenv("GRADEBOX_KEEP_SCRATCH") != nullptr) {
    spdlog::info("scratch: keeping {}", path_.string());
    path_.clear();
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    spdlog::warn(
        "scratch: failed to remove {}: {}", path_.string(), ec.message());
  } else {
    spdlog::debug("scratch: removed {}", path_.string());
  }
  path_.clear();
}

}  // namespace gradebox::common
