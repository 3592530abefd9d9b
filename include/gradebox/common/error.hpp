#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>

namespace gradebox {

// Failure categories visible to callers of the engine.
enum class ErrorKind : uint8_t {
  kCompileError,           // Submission rejected by the toolchain
  kCompileTimeout,         // Toolchain exceeded the compile timeout
  kExecutionTimeout,       // Test run exceeded the execution timeout
  kExecutionRuntimeError,  // Nonzero exit, signal, or single-run fault
  kOutputMismatch,         // Ran cleanly, output differs after normalization
  kInternalError,          // Engine unusable (toolchain, filesystem, bug)
};

auto ToString(ErrorKind kind) -> const char*;

struct EngineError {
  ErrorKind kind;
  std::string message;

  auto operator==(const EngineError&) const -> bool = default;

  static auto Internal(std::string msg) -> EngineError {
    return EngineError{.kind = ErrorKind::kInternalError,
                       .message = std::move(msg)};
  }

  static auto Runtime(std::string msg) -> EngineError {
    return EngineError{.kind = ErrorKind::kExecutionRuntimeError,
                       .message = std::move(msg)};
  }
};

template <typename T>
using Result = std::expected<T, EngineError>;

// Thrown for errors that must cross layers which do not return Result
// (configuration loading, engine bugs).
class EngineException : public std::exception {
 public:
  explicit EngineException(EngineError error) : error_(std::move(error)) {
  }

  [[nodiscard]] auto GetError() const -> const EngineError& {
    return error_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return error_.message.c_str();
  }

 private:
  EngineError error_;
};

}  // namespace gradebox
