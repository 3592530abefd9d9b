#pragma once

#include <filesystem>
#include <utility>

#include "gradebox/common/scratch_directory.hpp"

namespace gradebox::compiler {

// Runnable output of a successful compilation. Owns the scratch directory the
// executable lives in; destroying the artifact deletes both. Move-only, so
// exactly one owner releases it.
class Artifact {
 public:
  Artifact(common::ScratchDirectory scratch, std::filesystem::path executable)
      : scratch_(std::move(scratch)), executable_(std::move(executable)) {
  }

  Artifact(const Artifact&) = delete;
  auto operator=(const Artifact&) -> Artifact& = delete;
  Artifact(Artifact&&) noexcept = default;
  auto operator=(Artifact&&) noexcept -> Artifact& = default;
  ~Artifact() = default;

  [[nodiscard]] auto Executable() const -> const std::filesystem::path& {
    return executable_;
  }
  [[nodiscard]] auto Directory() const -> const std::filesystem::path& {
    return scratch_.Path();
  }

 private:
  common::ScratchDirectory scratch_;
  std::filesystem::path executable_;
};

}  // namespace gradebox::compiler
