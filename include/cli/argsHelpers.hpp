#pragma once

#include "cli/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hl::cli {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

// Every value given for a list flag, in command-line order.
std::vector<std::string> optVals(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

}
