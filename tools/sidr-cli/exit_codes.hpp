#pragma once

namespace sidr::cli {

// Exit codes of the sidr tool
// Named with SIDR_ prefix to avoid conflict with system macros
constexpr int SIDR_EXIT_SUCCESS = 0;
constexpr int SIDR_EXIT_USER_ERROR = 1;     // Invalid arguments, usage errors
constexpr int SIDR_EXIT_IO_ERROR = 3;       // Input directory unreadable

}  // namespace sidr::cli
