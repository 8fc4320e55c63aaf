#pragma once

#include "hub/types.hpp"

#include <string>
#include <vector>

namespace hl::hub {

/**
 * Remote repository operations used by the upload engine.
 *
 * Implementations report failure by throwing (HubError for protocol-level failures,
 * concurrency::Interrupted when the transfer was aborted on request). Every call must
 * be safe to repeat: the engine resubmits after any failure.
 */
class Client {
public:
    virtual ~Client() = default;

    // Returns the canonical "namespace/name" id; an existing repo is not an error.
    virtual std::string createRepoIfMissing(const std::string& repoId,
                                            const std::string& repoType,
                                            bool isPrivate) = 0;

    // Paths the server neither classifies nor ignores are left out of the result.
    virtual UploadModes classifyUploadModes(const RepoRef& repo, const std::vector<UploadInfo>& files) = 0;

    virtual void preuploadLargeFile(const RepoRef& repo, const LargeFile& file) = 0;

    virtual void createCommit(const RepoRef& repo,
                              const std::vector<CommitAddition>& additions,
                              const std::string& message) = 0;
};

}
