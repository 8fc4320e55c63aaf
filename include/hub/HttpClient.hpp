#pragma once

#include "hub/Client.hpp"
#include "config/Config.hpp"
#include "concurrency/Interrupt.hpp"
#include "util/curlWrappers.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace hl::hub {

class HttpClient final : public Client {
public:
    static constexpr size_t PREUPLOAD_CHUNK = 256;
    static constexpr size_t SAMPLE_SIZE = 512;

    HttpClient(config::HubConfig cfg, concurrency::InterruptFlag interrupt);

    std::string createRepoIfMissing(const std::string& repoId, const std::string& repoType, bool isPrivate) override;
    UploadModes classifyUploadModes(const RepoRef& repo, const std::vector<UploadInfo>& files) override;
    void preuploadLargeFile(const RepoRef& repo, const LargeFile& file) override;
    void createCommit(const RepoRef& repo, const std::vector<CommitAddition>& additions, const std::string& message) override;

    // {endpoint}/api/{type}s/{repo}/{action}/{revision}
    [[nodiscard]] std::string apiRepoUrl(const RepoRef& repo, const std::string& action) const;
    [[nodiscard]] std::string lfsBatchUrl(const RepoRef& repo) const;

    // One "header" line followed by one "file" or "lfsFile" line per addition.
    [[nodiscard]] static std::string buildCommitPayload(const std::vector<CommitAddition>& additions,
                                                        const std::string& message);

private:
    config::HubConfig cfg_;
    concurrency::InterruptFlag interrupt_;

    void addCommonHeaders(util::SList& headers) const;
    void applyTimeouts(CURL* h) const;

    util::HttpResponse send(const std::string& method,
                            const std::string& url,
                            const std::string& body,
                            const std::vector<std::string>& extraHeaders,
                            bool withAuth = true) const;

    // lfs.cpp
    void uploadBasic(const nlohmann::json& action, const LargeFile& file) const;
    void uploadMultipart(const nlohmann::json& action, const LargeFile& file, uint64_t chunkSize) const;
    void verifyUpload(const nlohmann::json& action, const LargeFile& file) const;
    std::string uploadPart(const std::string& url, const std::string& partData, int partNumber) const;
};

}
