#pragma once

#include "cli/types.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace hl::cli {

[[nodiscard]] bool looksNegativeNumber(std::string_view s);

// argv[1..] -> tokens. "--key=value" splits into a Flag and a Word; "--" stays a Word.
[[nodiscard]] std::vector<Token> tokenize(int argc, const char* const* argv);
[[nodiscard]] std::vector<Token> tokenize(const std::vector<std::string>& args);

/**
 * First Word is the command name. A Flag takes the following Word as its value, or
 * every following Word up to the next Flag when it is a list flag. A bare "--"
 * turns the rest of the line into positionals. Scalar flags are upserted (last wins).
 */
[[nodiscard]] CommandCall parseTokens(const std::vector<Token>& toks,
                                      const std::unordered_set<std::string>& listFlags = {},
                                      const std::unordered_set<std::string>& switchFlags = {});

}
