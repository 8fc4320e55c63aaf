#include "hub/HttpClient.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <map>
#include <memory>

using namespace hl::hub;
using namespace hl::util;
using namespace hl::logging;
using json = nlohmann::json;

namespace {

const std::vector<std::string> LFS_HEADERS = {
    "Accept: application/vnd.git-lfs+json",
    "Content-Type: application/vnd.git-lfs+json",
};

bool isDigits(const std::string& s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isdigit(c); });
}

uint64_t parseChunkSize(const json& v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() > 0) return static_cast<uint64_t>(v.get<int64_t>());
    if (v.is_string()) return std::stoull(v.get<std::string>());
    throw HubError("Malformed chunk_size in LFS upload action: " + v.dump(), 0);
}

std::string readRange(const std::filesystem::path& path, const uint64_t offset, const uint64_t length) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file for upload: " + path.string());
    in.seekg(static_cast<std::streamoff>(offset));

    std::string buf(length, '\0');
    in.read(buf.data(), static_cast<std::streamsize>(length));
    buf.resize(static_cast<size_t>(in.gcount()));
    if (buf.size() != length)
        throw std::runtime_error(fmt::format("Short read on {} at offset {}: wanted {}, got {}",
                                             path.string(), offset, length, buf.size()));
    return buf;
}

std::vector<std::string> actionHeaders(const json& action) {
    std::vector<std::string> out;
    if (!action.contains("header") || !action["header"].is_object()) return out;
    for (const auto& [k, v] : action["header"].items())
        if (v.is_string()) out.push_back(k + ": " + v.get<std::string>());
    return out;
}

}

void HttpClient::preuploadLargeFile(const RepoRef& repo, const LargeFile& file) {
    json payload = {
        {"operation", "upload"},
        {"transfers", json::array({"basic", "multipart"})},
        {"objects", json::array({json{{"oid", file.sha256}, {"size", file.size}}})},
        {"hash_algo", "sha256"},
    };
    if (!repo.revision.empty()) payload["ref"] = {{"name", repo.revision}};

    const auto resp = send("POST", lfsBatchUrl(repo), payload.dump(), LFS_HEADERS);
    if (!resp.ok()) {
        LogRegistry::hub()->error("[HttpClient] LFS batch for {} failed: HTTP={} Response:\n{}",
                                  file.path_in_repo, resp.http, resp.body);
        throw HubError(fmt::format("LFS batch request failed for {} (HTTP {})", file.path_in_repo, resp.http), resp.http);
    }

    const auto reply = json::parse(resp.body);
    const auto& objects = reply.at("objects");
    if (!objects.is_array() || objects.empty())
        throw HubError("LFS batch response has no objects for " + file.path_in_repo, resp.http);

    const auto& obj = objects.front();
    if (obj.contains("error")) {
        const auto& err = obj["error"];
        throw HubError(fmt::format("LFS batch error for {}: {} {}", file.path_in_repo,
                                   err.value("code", 0L), err.value("message", std::string{})),
                       err.value("code", 0L));
    }

    const auto actions = obj.value("actions", json::object());
    if (!actions.contains("upload")) {
        LogRegistry::hub()->debug("[HttpClient] {} already present on the remote, nothing to upload", file.path_in_repo);
        return;
    }

    const auto& upload = actions["upload"];
    if (upload.contains("header") && upload["header"].contains("chunk_size"))
        uploadMultipart(upload, file, parseChunkSize(upload["header"]["chunk_size"]));
    else
        uploadBasic(upload, file);

    if (actions.contains("verify")) verifyUpload(actions["verify"], file);

    LogRegistry::hub()->debug("[HttpClient] Uploaded LFS object {} ({} bytes) for {}", file.sha256, file.size, file.path_in_repo);
}

void HttpClient::uploadBasic(const json& action, const LargeFile& file) const {
    const auto url = action.at("href").get<std::string>();

    std::unique_ptr<FILE, decltype(&std::fclose)> fp(std::fopen(file.local_path.c_str(), "rb"), &std::fclose);
    if (!fp) throw std::runtime_error("Failed to open file for upload: " + file.local_path.string());

    SList headers;
    for (const auto& h : actionHeaders(action)) headers.add(h);

    // Default read callback freads from READDATA; CURLOPT_UPLOAD makes this a PUT
    const auto resp = performCurl(interrupt_, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_READDATA, fp.get());
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(file.size));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        applyTimeouts(h);
    });

    if (!resp.ok())
        throw HubError(fmt::format("Failed to upload {} (CURL={} HTTP={}): {}",
                                   file.path_in_repo, static_cast<int>(resp.curl), resp.http, resp.body), resp.http);
}

std::string HttpClient::uploadPart(const std::string& url, const std::string& partData, const int partNumber) const {
    const auto resp = send("PUT", url, partData, {"Content-Type: application/octet-stream"}, false);
    if (!resp.ok())
        throw HubError(fmt::format("Failed to upload part {}: CURL={} HTTP={}", partNumber, static_cast<int>(resp.curl), resp.http),
                       resp.http);

    const auto etag = findHeader(resp.hdr, "ETag");
    if (!etag || etag->empty())
        throw HubError(fmt::format("Failed to extract ETag for uploaded part {}", partNumber), resp.http);
    return *etag;
}

void HttpClient::uploadMultipart(const json& action, const LargeFile& file, const uint64_t chunkSize) const {
    if (chunkSize == 0) throw HubError("LFS multipart upload with zero chunk size for " + file.path_in_repo, 0);

    std::map<int, std::string> partUrls;
    for (const auto& [k, v] : action.at("header").items())
        if (isDigits(k) && v.is_string()) partUrls.emplace(std::stoi(k), v.get<std::string>());

    const auto expected = (file.size + chunkSize - 1) / chunkSize;
    if (partUrls.size() != expected)
        throw HubError(fmt::format("LFS multipart upload for {}: expected {} part URLs, got {}",
                                   file.path_in_repo, expected, partUrls.size()), 0);

    json parts = json::array();
    uint64_t offset = 0;
    for (const auto& [partNumber, url] : partUrls) {
        concurrency::throwIfInterrupted(interrupt_, "multipart upload of " + file.path_in_repo);

        const auto len = std::min(chunkSize, file.size - offset);
        const auto etag = uploadPart(url, readRange(file.local_path, offset, len), partNumber);
        parts.push_back({{"partNumber", partNumber}, {"etag", etag}});
        offset += len;
    }

    const json completion = {{"oid", file.sha256}, {"parts", parts}};
    const auto resp = send("POST", action.at("href").get<std::string>(), completion.dump(), LFS_HEADERS, false);
    if (!resp.ok()) {
        LogRegistry::hub()->error("[HttpClient] Completing multipart upload of {} failed: HTTP={} Response:\n{}",
                                  file.path_in_repo, resp.http, resp.body);
        throw HubError(fmt::format("Failed to complete multipart upload of {} (HTTP {})", file.path_in_repo, resp.http),
                       resp.http);
    }
}

void HttpClient::verifyUpload(const json& action, const LargeFile& file) const {
    auto headers = LFS_HEADERS;
    for (auto& h : actionHeaders(action)) headers.push_back(std::move(h));

    const json body = {{"oid", file.sha256}, {"size", file.size}};
    const auto resp = send("POST", action.at("href").get<std::string>(), body.dump(), headers);
    if (!resp.ok())
        throw HubError(fmt::format("LFS verify failed for {} (HTTP {}): {}", file.path_in_repo, resp.http, resp.body),
                       resp.http);
}
