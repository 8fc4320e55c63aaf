#pragma once

#include "cli/types.hpp"
#include "cli/UploadCommand.hpp"
#include "concurrency/Interrupt.hpp"

namespace hl::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_SETUP_ERROR = 1;
inline constexpr int EXIT_INTERRUPTED = 130;

// Parses argv and runs the requested command; never throws for user errors.
[[nodiscard]] CommandResult run(int argc, const char* const* argv, const concurrency::InterruptFlag& interrupt);

[[nodiscard]] CommandResult runUpload(const UploadInvocation& inv, const concurrency::InterruptFlag& interrupt);

}
