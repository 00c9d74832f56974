#pragma once

#include <cstdint>
#include <string>

#include "core/CommitObject.hpp"
#include "core/ObjectStore.hpp"
#include "core/TreeWalker.hpp"
#include "model/GitStats.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

struct LineDelta {
    int64_t additions{0};
    int64_t deletions{0};
};

/**
 * @brief Turns one tree change into a FileDelta with line counts
 *
 * measure() may throw ObjectStoreError when it needs blob content that
 * cannot be read; the caller turns that into a per-commit failure.
 */
class IDiffStrategy {
public:
    virtual ~IDiffStrategy() = default;
    virtual DiffMode mode() const = 0;
    virtual FileDelta measure(const TreeChange& change) const = 0;
};

/// Status-only estimate: added 1/0, removed 0/1, modified 1/1, unknown 0/0
class FastDiffStrategy : public IDiffStrategy {
public:
    DiffMode mode() const override { return DiffMode::Fast; }
    FileDelta measure(const TreeChange& change) const override;
};

/// Content-based counts using the multiset line comparison
class FullDiffStrategy : public IDiffStrategy {
public:
    explicit FullDiffStrategy(const ObjectStore& store) : store(store) {}
    DiffMode mode() const override { return DiffMode::Full; }
    FileDelta measure(const TreeChange& change) const override;

private:
    const ObjectStore& store;
};

/**
 * @brief Diffs a commit against its first parent
 *
 * Root commits diff against the empty tree. When the parent commit is
 * missing (shallow boundary) every file of the commit is reported with
 * status unknown.
 */
class DiffEngine {
public:
    explicit DiffEngine(const ObjectStore& store);

    /**
     * @brief Per-file deltas plus rolled-up stats for @p commit
     * @return CommitDetail, or an error when the commit's tree or a needed blob is unreadable
     */
    Expected<CommitDetail> diffCommit(const CommitObject& commit, DiffMode mode) const;

    const IDiffStrategy& strategy(DiffMode mode) const;

    /**
     * @brief Bag-of-lines comparison
     *
     * Both sides are split on '\n' (a trailing newline yields a final empty
     * line on both sides). additions = sum of max(0, new - old) per distinct
     * line, deletions = sum of max(0, old - new).
     */
    static LineDelta lineDiff(const std::string& oldContent, const std::string& newContent);

private:
    Expected<std::vector<TreeChange>> collectChanges(const CommitObject& commit) const;

    const ObjectStore& store;
    TreeWalker walker;
    FastDiffStrategy fast;
    FullDiffStrategy full;
};

}
