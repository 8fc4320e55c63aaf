#pragma once

#include "upload/model/Job.hpp"
#include "hub/Client.hpp"
#include "metadata/Store.hpp"
#include "concurrency/Interrupt.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hl::upload {

struct StageSettings {
    uintmax_t hash_chunk_size = 1024 * 1024;
    std::string commit_message = "Add files using hubload";
};

/**
 * Handlers for the four pipeline stages. Each works on the private copies carried by
 * a Job and persists every task it changes.
 *
 * Recoverable failures come back as a failed StageResult with the items left as they
 * were, so release() puts them back on the queue they came from. Interrupted and
 * InvariantViolation always propagate.
 */
class Stages {
public:
    static constexpr size_t SAMPLE_SIZE = 512;

    Stages(hub::Client& client,
           const metadata::Store& store,
           hub::RepoRef repo,
           StageSettings settings,
           concurrency::InterruptFlag interrupt);

    StageResult run(Job& job);

    StageResult hash(types::FileTask& task);
    StageResult classify(std::vector<types::FileTask>& tasks);
    StageResult preupload(types::FileTask& task);
    StageResult commit(std::vector<types::FileTask>& tasks);

private:
    hub::Client& client_;
    const metadata::Store& store_;
    hub::RepoRef repo_;
    StageSettings settings_;
    concurrency::InterruptFlag interrupt_;

    void persist(const types::FileTask& task) const;
};

}
