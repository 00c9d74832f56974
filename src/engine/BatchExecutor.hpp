#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/Constants.hpp"
#include "engine/DiffEngine.hpp"
#include "model/GitStats.hpp"

namespace gitpulse {

/**
 * @brief Diffs the whole history in fixed-size concurrent batches
 *
 * Every commit of a batch runs as its own std::async task; the batch is
 * joined before the next one starts. Failed commits are logged at warn
 * and left out. Details come back in commit order.
 */
class BatchExecutor {
public:
    /// Called after each batch with commits processed so far and the total
    using ProgressCallback = std::function<void(size_t completed, size_t total)>;

    struct Outcome {
        std::vector<CommitDetail> details;
        size_t failed{0};
    };

    explicit BatchExecutor(const DiffEngine& engine, size_t batchSize = Constants::BATCH_SIZE);

    size_t batchSize() const { return size; }

    /**
     * @param commits History, newest first
     * @param modes Diff mode per commit (same length as @p commits)
     */
    Outcome run(const std::vector<CommitObject>& commits, const std::vector<DiffMode>& modes,
                const ProgressCallback& onProgress = nullptr) const;

    /// "Diffing commits... k/N"
    static std::string progressMessage(size_t completed, size_t total);

private:
    const DiffEngine& engine;
    size_t size;
};

}
