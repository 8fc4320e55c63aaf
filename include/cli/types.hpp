#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hl::cli {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;        // list flags appear once per value
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                  // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

}
