#include "types/FileTask.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

namespace hl::types {

std::string to_string(const UploadMode mode) {
    switch (mode) {
        case UploadMode::Regular: return "regular";
        case UploadMode::Lfs: return "lfs";
    }
    throw std::invalid_argument("Unknown upload mode");
}

std::optional<UploadMode> parseUploadMode(const std::string& str) {
    if (str == "regular") return UploadMode::Regular;
    if (str == "lfs") return UploadMode::Lfs;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const UploadMode& m) {
    j = to_string(m);
}

void from_json(const nlohmann::json& j, UploadMode& m) {
    const auto parsed = parseUploadMode(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("Invalid upload mode: " + j.get<std::string>());
    m = *parsed;
}

}
