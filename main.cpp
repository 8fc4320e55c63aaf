#include "cli/Cli.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

using namespace hl;

namespace {
concurrency::InterruptFlag interruptFlag = concurrency::makeInterruptFlag();

void signalHandler(const int) {
    interruptFlag->store(true, std::memory_order_release);
}
}

int main(const int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto result = cli::run(argc, argv, interruptFlag);

    if (!result.stdout_text.empty()) std::cout << result.stdout_text;
    if (!result.stderr_text.empty()) std::cerr << result.stderr_text;

    return result.exit_code;
}
