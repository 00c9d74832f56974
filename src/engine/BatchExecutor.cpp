#include "engine/BatchExecutor.hpp"

#include <algorithm>
#include <future>

#include "util/Logger.hpp"

namespace gitpulse {

BatchExecutor::BatchExecutor(const DiffEngine& engine, size_t batchSize)
    : engine(engine), size(batchSize == 0 ? 1 : batchSize) {}

std::string BatchExecutor::progressMessage(size_t completed, size_t total) {
    return "Diffing commits... " + std::to_string(completed) + "/" + std::to_string(total);
}

BatchExecutor::Outcome BatchExecutor::run(const std::vector<CommitObject>& commits,
                                          const std::vector<DiffMode>& modes,
                                          const ProgressCallback& onProgress) const {
    Outcome outcome;
    const size_t total = commits.size();

    for (size_t batchStart = 0; batchStart < total; batchStart += size) {
        size_t batchEnd = std::min(batchStart + size, total);

        std::vector<std::future<Expected<CommitDetail>>> tasks;
        tasks.reserve(batchEnd - batchStart);
        for (size_t i = batchStart; i < batchEnd; ++i) {
            DiffMode mode = i < modes.size() ? modes[i] : DiffMode::Fast;
            const CommitObject& commit = commits[i];
            tasks.push_back(std::async(std::launch::async, [this, &commit, mode]() -> Expected<CommitDetail> {
                try {
                    return engine.diffCommit(commit, mode);
                } catch (const std::exception& e) {
                    return Error{ErrorCode::InternalError, commit.shortHash() + ": " + e.what()};
                }
            }));
        }

        // Join in submission order so details keep commit order
        for (auto& task : tasks) {
            Expected<CommitDetail> result = task.get();
            if (result) {
                outcome.details.push_back(std::move(result.value()));
            } else {
                ++outcome.failed;
                Logger::instance().warn("Skipping commit: " + result.error().message);
            }
        }

        if (onProgress) {
            onProgress(batchEnd, total);
        }
    }
    return outcome;
}

}
