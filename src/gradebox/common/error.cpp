#include "gradebox/common/error.hpp"

namespace gradebox {

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kCompileError:
      return "compile_error";
    case ErrorKind::kCompileTimeout:
      return "compile_timeout";
    case ErrorKind::kExecutionTimeout:
      return "execution_timeout";
    case ErrorKind::kExecutionRuntimeError:
      return "execution_runtime_error";
    case ErrorKind::kOutputMismatch:
      return "output_mismatch";
    case ErrorKind::kInternalError:
      return "internal_error";
  }
  return "internal_error";
}

}  // namespace gradebox
