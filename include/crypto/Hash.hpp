#pragma once

#include "concurrency/Interrupt.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace hl::crypto::hash {

// Streams the file through SHA-256 in chunkSize reads; checks the flag between chunks.
std::string sha256File(const std::filesystem::path& filepath,
                       uintmax_t chunkSize,
                       const concurrency::InterruptFlag& interrupt = nullptr);

std::string sha256Hex(std::string_view data);

std::string b64_encode(std::string_view data);

}
