#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/ObjectStore.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

/**
 * @brief A git repository opened read-only from disk
 *
 * Accepted layouts:
 *   <path>/            bare: HEAD, objects/, refs/, packed-refs
 *   <path>/.git/       worktree: the same entries under .git
 *
 * HEAD is either "ref: refs/heads/<branch>" or a detached commit id.
 * A symbolic ref resolves through refs/<...> first and packed-refs second.
 *
 * Each instance owns its ObjectStore. The stats worker opens one
 * repository per run and never shares it outside its thread.
 */
class Repository {
public:
    /**
     * @brief Open the repository at @p path
     * @return Repository, or NotARepository / CorruptObject error
     */
    static Expected<std::unique_ptr<Repository>> open(const std::filesystem::path& path);

    /// The git directory (bare root or <worktree>/.git)
    const std::filesystem::path& gitDir() const { return gitDirPath; }

    const ObjectStore& objects() const { return *store; }
    ObjectStore& objects() { return *store; }

    /**
     * @brief Resolve HEAD to a commit id
     * @return Commit id, or RefNotFound when HEAD names a branch with no commits
     */
    Expected<std::string> resolveHead() const;

    /**
     * @brief Resolve a full ref name ("refs/heads/main") to an id
     * @return Id, or RefNotFound when neither a loose ref nor packed-refs has it
     */
    Expected<std::string> resolveRef(const std::string& refName) const;

    /**
     * @brief First-parent history starting at @p tip, newest first
     *
     * Stops after @p maxCount commits, at a root commit, or at a parent
     * that is not in the object store (the boundary of a shallow clone).
     * Annotated tags at @p tip are peeled.
     *
     * @return Commits, or an error if @p tip itself cannot be read
     */
    Expected<std::vector<CommitObject>> firstParentHistory(const std::string& tip, size_t maxCount) const;

private:
    Repository(std::filesystem::path gitDir, std::unique_ptr<ObjectStore> store);

    Expected<std::string> peelToCommit(const std::string& id) const;

    std::filesystem::path gitDirPath;
    std::unique_ptr<ObjectStore> store;
};

}
