#pragma once

#include <filesystem>
#include <string_view>

#include "gradebox/common/error.hpp"

namespace gradebox::common {

// Default root for per-request scratch directories: <temp>/gradebox
auto DefaultScratchRoot() -> std::filesystem::path;

// RAII owner of a uniquely named scratch directory. The directory and all of
// its contents are removed exactly once, when the owning object is destroyed
// (unless GRADEBOX_KEEP_SCRATCH is set). Moved-from objects own nothing.
class ScratchDirectory {
 public:
  // Create <root>/<prefix>-<pid>-<counter>-<nonce>. The leaf is created with
  // exclusive semantics, so concurrent requests in this or any other process
  // never share a directory.
  static auto Create(const std::filesystem::path& root, std::string_view prefix)
      -> Result<ScratchDirectory>;

  ScratchDirectory() = default;

  ScratchDirectory(const ScratchDirectory&) = delete;
  auto operator=(const ScratchDirectory&) -> ScratchDirectory& = delete;

  ScratchDirectory(ScratchDirectory&& other) noexcept;
  auto operator=(ScratchDirectory&& other) noexcept -> ScratchDirectory&;

  ~ScratchDirectory() noexcept;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto Empty() const -> bool {
    return path_.empty();
  }

 private:
  explicit ScratchDirectory(std::filesystem::path path);

  void Cleanup() noexcept;

  std::filesystem::path path_;
};

}  // namespace gradebox::common
