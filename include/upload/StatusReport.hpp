#pragma once

#include "upload/WorkQueueSet.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace hl::upload {

class StatusReport {
public:
    // Decimal units with one decimal: 999 -> "999.0", 1500 -> "1.5K", 2.3e9 -> "2.3G".
    [[nodiscard]] static std::string formatSize(uint64_t bytes);

    // "H:MM:SS"
    [[nodiscard]] static std::string formatElapsed(std::chrono::seconds elapsed);

    [[nodiscard]] static std::string render(const QueueSnapshot& s, std::time_t now, std::chrono::seconds elapsed);

    // Terminal rows taken by text once wrapped at width columns.
    [[nodiscard]] static size_t terminalRows(const std::string& text, size_t width);

    // Moves the cursor up over the last `rows` printed rows, clearing each one.
    [[nodiscard]] static std::string eraseRows(size_t rows);
};

}
