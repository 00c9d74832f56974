#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/ObjectStore.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

enum class ChangeStatus { Added, Modified, Removed, Unknown };

const char* changeStatusName(ChangeStatus status);

/// One changed blob path between two trees
struct TreeChange {
    std::string path;      // "src/main.cpp"
    std::string oldId;     // empty when added, or unknown on the old side
    std::string newId;     // empty when removed, or unknown on the new side
    ChangeStatus status{ChangeStatus::Unknown};
};

/**
 * @brief Compares tree snapshots straight from the object store
 *
 * Entries are matched by name within each directory and visited in byte
 * order of their names, subdirectories expanded in place. Subtrees whose
 * ids match are skipped without being read. Gitlinks (submodules) are
 * ignored on both sides.
 *
 * Unreadable trees:
 *   - new root           the walk fails
 *   - old root           every new leaf is reported Unknown
 *   - nested, one side   the readable side's leaves are reported Unknown
 *   - nested, both sides or an added/removed subtree
 *                        a single Unknown change for the directory path
 */
class TreeWalker {
public:
    using ChangeCallback = std::function<void(const TreeChange&)>;
    using LeafCallback = std::function<void(const std::string& path, const TreeEntry& entry)>;

    explicit TreeWalker(const ObjectStore& store) : store(store) {}

    /**
     * @brief Report every blob path that differs between two trees
     * @param oldTree Old root tree id, empty for a root commit
     * @param newTree New root tree id
     * @return Error only when @p newTree cannot be read
     */
    Expected<void> diff(const std::string& oldTree, const std::string& newTree, const ChangeCallback& onChange) const;

    /// Collect diff() results into a vector
    Expected<std::vector<TreeChange>> changes(const std::string& oldTree, const std::string& newTree) const;

    /**
     * @brief Visit every blob leaf of one tree
     *
     * Unreadable nested subtrees are skipped (logged at debug).
     * @return Error only when @p tree cannot be read
     */
    Expected<void> walkTree(const std::string& tree, const LeafCallback& onLeaf) const;

private:
    void diffEntries(const std::string& prefix, const std::vector<TreeEntry>& oldEntries,
                     const std::vector<TreeEntry>& newEntries, const ChangeCallback& onChange) const;
    void diffSubtrees(const std::string& path, const std::string& oldId, const std::string& newId,
                      const ChangeCallback& onChange) const;
    void expand(const std::string& path, const std::string& treeId, ChangeStatus status, bool oldSide,
                const ChangeCallback& onChange) const;
    void emitLeaves(const std::string& prefix, const std::vector<TreeEntry>& entries, ChangeStatus status,
                    bool oldSide, const ChangeCallback& onChange) const;
    void walkEntries(const std::string& prefix, const std::vector<TreeEntry>& entries, const LeafCallback& onLeaf) const;

    const ObjectStore& store;
};

}
