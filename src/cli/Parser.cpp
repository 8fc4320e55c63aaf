#include "cli/Parser.hpp"

namespace hl::cli {

namespace {

void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

void pushArg(std::vector<Token>& out, const std::string& arg) {
    if (arg == "--" || arg.size() < 2 || arg[0] != '-' || looksNegativeNumber(arg)) {
        out.push_back({TokenType::Word, arg});
        return;
    }

    auto key = arg.substr(arg[1] == '-' ? 2 : 1);
    if (const auto eq = key.find('='); eq != std::string::npos) {
        out.push_back({TokenType::Flag, key.substr(0, eq)});
        out.push_back({TokenType::Word, key.substr(eq + 1)});
        return;
    }
    out.push_back({TokenType::Flag, std::move(key)});
}

}

bool looksNegativeNumber(const std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

std::vector<Token> tokenize(const int argc, const char* const* argv) {
    std::vector<Token> out;
    out.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) pushArg(out, argv[i]);
    return out;
}

std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size());
    for (const auto& a : args) pushArg(out, a);
    return out;
}

CommandCall parseTokens(const std::vector<Token>& toks,
                        const std::unordered_set<std::string>& listFlags,
                        const std::unordered_set<std::string>& switchFlags) {
    CommandCall call;
    size_t i = 0;

    // Command name = first Word; a leading Flag (e.g. --help) is kept as the option list
    if (!toks.empty() && toks[0].type == TokenType::Word && toks[0].text != "--") {
        call.name = toks[0].text;
        i = 1;
    }

    bool stopFlags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stopFlags && t.type == TokenType::Word && t.text == "--") {
            stopFlags = true;
            continue;
        }

        if (!stopFlags && t.type == TokenType::Flag) {
            const auto& key = t.text;

            if (listFlags.contains(key)) {
                bool any = false;
                while (i + 1 < toks.size() && toks[i + 1].type == TokenType::Word && toks[i + 1].text != "--") {
                    call.options.push_back(FlagKV{key, toks[++i].text});
                    any = true;
                }
                if (!any) call.options.push_back(FlagKV{key, std::nullopt});
                continue;
            }

            if (!switchFlags.contains(key) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word
                && toks[i + 1].text != "--") {
                setOpt(call, key, toks[i + 1].text);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
