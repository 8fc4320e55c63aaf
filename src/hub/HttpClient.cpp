#include "hub/HttpClient.hpp"
#include "crypto/Hash.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

using namespace hl::hub;
using namespace hl::util;
using namespace hl::logging;
using namespace hl::crypto::hash;
using json = nlohmann::json;

namespace {

constexpr const char* USER_AGENT = "hubload/1.0";

[[noreturn]] void raise(const std::string& what, const HttpResponse& r) {
    if (r.curl != CURLE_OK)
        throw HubError(fmt::format("{}: {}", what, curl_easy_strerror(r.curl)), 0);
    throw HubError(fmt::format("{} (HTTP {}): {}", what, r.http, r.body), r.http);
}

std::string readWholeFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file for commit: " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::string stripPrefix(std::string s, const std::string& prefix) {
    if (!prefix.empty() && s.starts_with(prefix)) s.erase(0, prefix.size());
    return s;
}

}

HttpClient::HttpClient(config::HubConfig cfg, concurrency::InterruptFlag interrupt)
    : cfg_(std::move(cfg)), interrupt_(std::move(interrupt)) {
    while (!cfg_.endpoint.empty() && cfg_.endpoint.back() == '/') cfg_.endpoint.pop_back();
}

std::string HttpClient::apiRepoUrl(const RepoRef& repo, const std::string& action) const {
    const CurlEasy h;
    return fmt::format("{}/api/{}s/{}/{}/{}", cfg_.endpoint, repo.repo_type, repo.repo_id, action, h.escape(repo.revision));
}

std::string HttpClient::lfsBatchUrl(const RepoRef& repo) const {
    return fmt::format("{}/{}{}.git/info/lfs/objects/batch", cfg_.endpoint, repoUrlPrefix(repo.repo_type), repo.repo_id);
}

void HttpClient::addCommonHeaders(SList& headers) const {
    headers.add(std::string("User-Agent: ") + USER_AGENT);
    if (!cfg_.token.empty()) headers.add("Authorization: Bearer " + cfg_.token);
}

void HttpClient::applyTimeouts(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
    if (cfg_.low_speed_timeout_seconds > 0) {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg_.low_speed_timeout_seconds));
    }
}

HttpResponse HttpClient::send(const std::string& method,
                              const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& extraHeaders,
                              const bool withAuth) const {
    SList headers;
    if (withAuth) addCommonHeaders(headers);
    for (const auto& hdr : extraHeaders) headers.add(hdr);

    auto resp = performCurl(interrupt_, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        applyTimeouts(h);
    });

    if (!resp.ok())
        LogRegistry::hub()->debug("[HttpClient] {} {} -> CURL={} HTTP={}", method, url, static_cast<int>(resp.curl), resp.http);

    return resp;
}

std::string HttpClient::createRepoIfMissing(const std::string& repoId, const std::string& repoType, const bool isPrivate) {
    json body = {{"type", repoType}, {"private", isPrivate}};
    if (const auto slash = repoId.find('/'); slash != std::string::npos) {
        body["organization"] = repoId.substr(0, slash);
        body["name"] = repoId.substr(slash + 1);
    } else body["name"] = repoId;

    const auto url = cfg_.endpoint + "/api/repos/create";
    const auto resp = send("POST", url, body.dump(), {"Content-Type: application/json"});

    if (resp.curl == CURLE_OK && resp.http == 409) {
        LogRegistry::hub()->debug("[HttpClient] Repo {} already exists", repoId);
        return repoId;
    }

    if (!resp.ok()) {
        LogRegistry::hub()->error("[HttpClient] Failed to create repo {}: HTTP={} Response:\n{}", repoId, resp.http, resp.body);
        raise("Failed to create repo " + repoId, resp);
    }

    // {"url": "https://host/datasets/ns/name"} -> "ns/name"
    const auto reply = json::parse(resp.body, nullptr, false);
    if (reply.is_object() && reply.contains("url") && reply["url"].is_string()) {
        auto id = stripPrefix(reply["url"].get<std::string>(), cfg_.endpoint + "/");
        id = stripPrefix(id, repoUrlPrefix(repoType));
        while (!id.empty() && id.back() == '/') id.pop_back();
        if (!id.empty()) return id;
    }

    return repoId;
}

UploadModes HttpClient::classifyUploadModes(const RepoRef& repo, const std::vector<UploadInfo>& files) {
    UploadModes out;
    const auto url = apiRepoUrl(repo, "preupload");

    for (size_t start = 0; start < files.size(); start += PREUPLOAD_CHUNK) {
        const auto end = std::min(files.size(), start + PREUPLOAD_CHUNK);

        json payload = {{"files", json::array()}};
        for (size_t i = start; i < end; ++i) {
            const auto& f = files[i];
            payload["files"].push_back({
                {"path", f.path_in_repo},
                {"sample", b64_encode(f.sample)},
                {"size", f.size},
                {"sha", f.sha256},
            });
        }

        const auto resp = send("POST", url, payload.dump(), {"Content-Type: application/json"});
        if (!resp.ok()) raise("Failed to fetch upload modes for " + repo.repo_id, resp);

        const auto reply = json::parse(resp.body);
        for (const auto& f : reply.at("files")) {
            const auto path = f.at("path").get<std::string>();
            if (f.contains("shouldIgnore") && f["shouldIgnore"].is_boolean() && f["shouldIgnore"].get<bool>())
                out.ignored.insert(path);

            if (!f.contains("uploadMode") || !f["uploadMode"].is_string()) continue;
            if (const auto mode = types::parseUploadMode(f["uploadMode"].get<std::string>())) out.modes[path] = *mode;
            else LogRegistry::hub()->warn("[HttpClient] Unknown upload mode '{}' for {}", f["uploadMode"].dump(), path);
        }
    }

    return out;
}

std::string HttpClient::buildCommitPayload(const std::vector<CommitAddition>& additions, const std::string& message) {
    std::string out = json{{"key", "header"}, {"value", {{"summary", message}, {"description", ""}}}}.dump();
    out += '\n';

    for (const auto& a : additions) {
        json line;
        if (a.mode == types::UploadMode::Lfs) {
            line = {{"key", "lfsFile"},
                    {"value", {{"path", a.path_in_repo}, {"algo", "sha256"}, {"oid", a.sha256}, {"size", a.size}}}};
        } else {
            line = {{"key", "file"},
                    {"value", {{"content", b64_encode(readWholeFile(a.local_path))},
                               {"path", a.path_in_repo},
                               {"encoding", "base64"}}}};
        }
        out += line.dump();
        out += '\n';
    }

    return out;
}

void HttpClient::createCommit(const RepoRef& repo, const std::vector<CommitAddition>& additions, const std::string& message) {
    const auto body = buildCommitPayload(additions, message);
    const auto resp = send("POST", apiRepoUrl(repo, "commit"), body, {"Content-Type: application/x-ndjson"});

    if (!resp.ok()) {
        LogRegistry::hub()->error("[HttpClient] Commit of {} files to {} failed: HTTP={} Response:\n{}",
                                  additions.size(), repo.repo_id, resp.http, resp.body);
        raise("Failed to commit to " + repo.repo_id, resp);
    }

    LogRegistry::hub()->debug("[HttpClient] Committed {} files to {}@{}", additions.size(), repo.repo_id, repo.revision);
}
