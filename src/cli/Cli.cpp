#include "cli/Cli.hpp"
#include "cli/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "hub/HttpClient.hpp"
#include "logging/LogRegistry.hpp"
#include "upload/errors.hpp"

#include <fmt/format.h>
#include <cstdio>
#include <iostream>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace hl::config;
using namespace hl::logging;
using namespace hl::upload;

namespace fs = std::filesystem;

namespace hl::cli {

CommandResult run(const int argc, const char* const* argv, const concurrency::InterruptFlag& interrupt) {
    const auto parsed = parseArgs(argc, argv);
    if (parsed.help) return ok(usageText());
    if (!parsed.ok) return {EXIT_SETUP_ERROR, usageText(), "Error: " + parsed.error + "\n"};
    return runUpload(parsed.invocation, interrupt);
}

CommandResult runUpload(const UploadInvocation& inv, const concurrency::InterruptFlag& interrupt) {
    const auto& opts = inv.options;

    // Logs live inside the folder by default, so it has to exist before logging starts
    std::error_code ec;
    if (!fs::is_directory(opts.folder, ec))
        return invalid(fmt::format("Error: provided path '{}' is not a directory\n", opts.folder.string()));

    // Printed up front since the upload itself may run for hours
    std::cout << uploadWarning(fs::absolute(opts.folder), ::isatty(::fileno(stdout)) != 0) << std::endl;

    try {
        ConfigRegistry::init(inv.config_path.value_or(paths::getConfigPath()));
    } catch (const YAML::Exception& e) {
        return invalid(fmt::format("Error: failed to load configuration: {}\n", e.what()));
    }
    if (inv.token) ConfigRegistry::mutate().hub.token = *inv.token;

    const auto& cfg = ConfigRegistry::get();
    const auto logDir = cfg.logging.log_dir.empty() ? paths::getLogDir(fs::absolute(opts.folder)) : cfg.logging.log_dir;
    if (!LogRegistry::isInitialized()) LogRegistry::init(logDir);
    LogRegistry::cli()->debug("[Cli] Effective configuration: {}", nlohmann::json(cfg).dump());

    try {
        hub::HttpClient client(cfg.hub, interrupt);
        LargeFolderUpload upload(opts, client, cfg, interrupt);
        const auto summary = upload.run();
        LogRegistry::flushAll();

        if (summary.interrupted)
            return {EXIT_INTERRUPTED, "", "Interrupted. Re-run the same command to resume the upload.\n"};

        return ok(fmt::format("Uploaded {} files to {} ({} committed, {} ignored) in {}s\n",
                              summary.files_total, summary.repo_id, summary.files_committed,
                              summary.files_ignored, summary.elapsed.count()));
    } catch (const SetupError& e) {
        LogRegistry::cli()->error("[Cli] {}", e.what());
        return invalid(fmt::format("Error: {}\n", e.what()));
    } catch (const concurrency::Interrupted& e) {
        LogRegistry::cli()->warn("[Cli] {}", e.what());
        return {EXIT_INTERRUPTED, "", "Interrupted. Re-run the same command to resume the upload.\n"};
    } catch (const InvariantViolation& e) {
        LogRegistry::cli()->critical("[Cli] Internal error, upload stopped: {}", e.what());
        LogRegistry::flushAll();
        return invalid(fmt::format("Internal error: {}\n", e.what()));
    } catch (const std::exception& e) {
        LogRegistry::cli()->error("[Cli] Upload failed: {}", e.what());
        LogRegistry::flushAll();
        return invalid(fmt::format("Error: {}\n", e.what()));
    }
}

}
