#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gradebox/common/error.hpp"
#include "gradebox/compiler/artifact.hpp"

namespace gradebox::compiler {

struct CompilationResult {
  bool success = false;
  // Present iff success; ownership passes to whoever holds the result
  std::optional<Artifact> artifact;
  // Toolchain diagnostics, populated only on failure
  std::string diagnostics;
  bool timed_out = false;

  static auto Failed(std::string diagnostics, bool timed_out = false)
      -> CompilationResult;
  static auto Succeeded(Artifact artifact) -> CompilationResult;
};

// Turns submitted source text into a runnable artifact.
// A rejected submission is a successful call with success == false; the
// error channel is reserved for kInternalError (toolchain or scratch area
// unusable).
class Compiler {
 public:
  Compiler() = default;
  virtual ~Compiler() = default;

  Compiler(const Compiler&) = delete;
  auto operator=(const Compiler&) -> Compiler& = delete;
  Compiler(Compiler&&) = delete;
  auto operator=(Compiler&&) -> Compiler& = delete;

  virtual auto Compile(std::string_view source) -> Result<CompilationResult> = 0;
};

struct ToolchainOptions {
  std::string compiler = "gcc";
  std::string standard = "c99";
  std::vector<std::string> flags = {"-Wall", "-Wextra"};
  std::string source_extension = ".c";
  std::chrono::milliseconds compile_timeout{10'000};
  // Upper bound on captured diagnostics
  std::size_t max_diagnostic_bytes = 1024 * 1024;
  std::filesystem::path scratch_root;  // Empty: DefaultScratchRoot()
};

// Compiles with one fixed external toolchain:
//   <compiler> -std=<standard> <flags...> -o <artifact> <source>
// inside a fresh per-request scratch directory.
class GccCompiler final : public Compiler {
 public:
  explicit GccCompiler(ToolchainOptions options);

  auto Compile(std::string_view source) -> Result<CompilationResult> override;

  [[nodiscard]] auto Options() const -> const ToolchainOptions& {
    return options_;
  }

 private:
  ToolchainOptions options_;
};

}  // namespace gradebox::compiler
