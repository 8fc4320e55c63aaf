#include "cli/UploadCommand.hpp"
#include "cli/Parser.hpp"
#include "cli/argsHelpers.hpp"
#include "config/paths.hpp"

#include <fmt/format.h>
#include <unordered_set>

namespace hl::cli {

namespace {

const std::unordered_set<std::string> LIST_FLAGS = {"include", "exclude"};
const std::unordered_set<std::string> SWITCH_FLAGS = {"private", "no-report", "help", "h"};
const std::unordered_set<std::string> VALUE_FLAGS = {"repo-type", "revision", "num-workers", "config", "token"};

ParseResult fail(std::string msg) {
    ParseResult r;
    r.error = std::move(msg);
    return r;
}

ParseResult parse(const std::vector<Token>& toks) {
    return parseUploadCommand(parseTokens(toks, LIST_FLAGS, SWITCH_FLAGS));
}

}

std::string usageText() {
    return "Usage: hubload upload-large-folder <repo_id> <local_path> [options]\n"
           "\n"
           "Upload a large local folder to a hub repository. The upload is resumable: progress\n"
           "is kept under <local_path>/.cache/huggingface/ and re-running the same command\n"
           "continues where the previous run stopped.\n"
           "\n"
           "Options:\n"
           "  --repo-type TYPE        model (default), dataset or space\n"
           "  --revision REV          branch to commit to (default: main)\n"
           "  --private               create the repo as private if it does not exist\n"
           "  --include PATTERN...    only upload files matching one of the patterns\n"
           "  --exclude PATTERN...    skip files matching one of the patterns\n"
           "  --num-workers N         number of worker threads (default: cpu count - 2, at least 2)\n"
           "  --no-report             do not print the periodic status report\n"
           "  --config PATH           configuration file (default: ~/.config/hubload/config.yaml)\n"
           "  --token TOKEN           access token (default: HF_TOKEN or the configuration file)\n"
           "  -h, --help              show this message\n";
}

std::string uploadWarning(const std::filesystem::path& folder, const bool color) {
    const auto text = fmt::format(
        "You are about to upload a large folder with `hubload upload-large-folder`.\n"
        "\n"
        "A few things to keep in mind:\n"
        "  - Repository limits of the hub still apply.\n"
        "  - Do not start several processes in parallel.\n"
        "  - You can interrupt and resume the process at any time. It picks up where it left off,\n"
        "    except for partially uploaded files that have to be uploaded again entirely.\n"
        "  - Do not upload the same folder to several repositories. If you need to do so, delete\n"
        "    the `./.cache/huggingface/` folder first.\n"
        "\n"
        "Some temporary metadata will be stored under `{}`.\n"
        "  - You must not modify those files manually.\n"
        "  - You must not delete the `./.cache/huggingface/` folder while a process is running.\n"
        "  - You can delete the `./.cache/huggingface/` folder to reset the upload state when no\n"
        "    process is running. Files will be hashed and pre-uploaded again, except for files\n"
        "    that are already committed.\n"
        "\n"
        "Use `--no-report` to disable the status report.\n",
        (folder / paths::CACHE_SUBDIR).string());

    if (!color) return text;
    return "\033[33m" + text + "\033[0m";
}

ParseResult parseUploadCommand(const CommandCall& call) {
    if (hasKey(call, "help") || hasKey(call, "h") || call.name == "help") {
        ParseResult r;
        r.ok = true;
        r.help = true;
        return r;
    }

    if (call.name.empty()) return fail("Missing command");
    if (call.name != UPLOAD_COMMAND) return fail("Unknown command '" + call.name + "'");

    for (const auto& [key, value] : call.options) {
        if (LIST_FLAGS.contains(key)) {
            if (!value) return fail("--" + key + " requires at least one pattern");
            continue;
        }
        if (SWITCH_FLAGS.contains(key)) continue;
        if (!VALUE_FLAGS.contains(key)) return fail("Unknown option --" + key);
        if (!value || value->empty()) return fail("--" + key + " requires a value");
    }

    if (call.positionals.size() != 2)
        return fail("Expected <repo_id> and <local_path>, got " + std::to_string(call.positionals.size()) + " positional arguments");

    ParseResult r;
    auto& opts = r.invocation.options;
    opts.repo_id = call.positionals[0];
    opts.folder = call.positionals[1];

    if (const auto t = optVal(call, "repo-type")) opts.repo_type = *t;
    if (const auto rev = optVal(call, "revision")) opts.revision = *rev;
    opts.is_private = hasFlag(call, "private");
    opts.allow_patterns = optVals(call, "include");
    opts.ignore_patterns = optVals(call, "exclude");
    if (hasFlag(call, "no-report")) opts.print_report = false;

    if (const auto n = optVal(call, "num-workers")) {
        const auto parsed = parseUInt(*n);
        if (!parsed || *parsed == 0) return fail("--num-workers must be a positive integer, got '" + *n + "'");
        opts.num_workers = *parsed;
    }

    if (const auto c = optVal(call, "config")) r.invocation.config_path = *c;
    if (const auto tok = optVal(call, "token")) r.invocation.token = *tok;

    r.ok = true;
    return r;
}

ParseResult parseArgs(const int argc, const char* const* argv) {
    return parse(tokenize(argc, argv));
}

ParseResult parseArgs(const std::vector<std::string>& args) {
    return parse(tokenize(args));
}

}
