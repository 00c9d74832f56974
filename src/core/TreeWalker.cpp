#include "core/TreeWalker.hpp"

#include <map>
#include <utility>

#include "util/Logger.hpp"

namespace gitpulse {

namespace {
    std::string joinPath(const std::string& prefix, const std::string& name) {
        return prefix.empty() ? name : prefix + "/" + name;
    }

    TreeChange makeChange(const std::string& path, const std::string& id, ChangeStatus status, bool oldSide) {
        TreeChange change;
        change.path = path;
        change.status = status;
        if (oldSide) {
            change.oldId = id;
        } else {
            change.newId = id;
        }
        return change;
    }
}

const char* changeStatusName(ChangeStatus status) {
    switch (status) {
        case ChangeStatus::Added: return "added";
        case ChangeStatus::Modified: return "modified";
        case ChangeStatus::Removed: return "removed";
        case ChangeStatus::Unknown: return "unknown";
    }
    return "unknown";
}

Expected<void> TreeWalker::diff(const std::string& oldTree, const std::string& newTree,
                                const ChangeCallback& onChange) const {
    std::vector<TreeEntry> newEntries;
    try {
        newEntries = store.readTree(newTree);
    } catch (const ObjectStoreError& e) {
        return Error{e.code(), std::string("Cannot read tree: ") + e.what()};
    }

    if (oldTree.empty()) {
        emitLeaves("", newEntries, ChangeStatus::Added, false, onChange);
        return {};
    }
    if (oldTree == newTree) {
        return {};
    }

    std::vector<TreeEntry> oldEntries;
    try {
        oldEntries = store.readTree(oldTree);
    } catch (const ObjectStoreError& e) {
        Logger::instance().debug(std::string("Old tree unreadable, reporting unknown: ") + e.what());
        emitLeaves("", newEntries, ChangeStatus::Unknown, false, onChange);
        return {};
    }

    diffEntries("", oldEntries, newEntries, onChange);
    return {};
}

Expected<std::vector<TreeChange>> TreeWalker::changes(const std::string& oldTree, const std::string& newTree) const {
    std::vector<TreeChange> out;
    auto result = diff(oldTree, newTree, [&out](const TreeChange& change) { out.push_back(change); });
    if (!result) return result.error();
    return out;
}

void TreeWalker::diffEntries(const std::string& prefix, const std::vector<TreeEntry>& oldEntries,
                             const std::vector<TreeEntry>& newEntries, const ChangeCallback& onChange) const {
    std::map<std::string, std::pair<const TreeEntry*, const TreeEntry*>> byName;
    for (const auto& entry : oldEntries) {
        if (!entry.isGitlink()) byName[entry.name].first = &entry;
    }
    for (const auto& entry : newEntries) {
        if (!entry.isGitlink()) byName[entry.name].second = &entry;
    }

    for (const auto& [name, sides] : byName) {
        const TreeEntry* oldEntry = sides.first;
        const TreeEntry* newEntry = sides.second;
        std::string path = joinPath(prefix, name);

        if (oldEntry && newEntry && oldEntry->hashHex == newEntry->hashHex &&
            oldEntry->isTree() == newEntry->isTree()) {
            continue;
        }

        bool oldBlob = oldEntry && oldEntry->isBlob();
        bool newBlob = newEntry && newEntry->isBlob();
        bool oldTree = oldEntry && oldEntry->isTree();
        bool newTree = newEntry && newEntry->isTree();

        if (oldBlob && newBlob) {
            TreeChange change;
            change.path = path;
            change.oldId = oldEntry->hashHex;
            change.newId = newEntry->hashHex;
            change.status = ChangeStatus::Modified;
            onChange(change);
            continue;
        }

        // A blob replaced by a directory (or the reverse) is a removal plus an expansion
        if (oldBlob) onChange(makeChange(path, oldEntry->hashHex, ChangeStatus::Removed, true));
        if (newBlob) onChange(makeChange(path, newEntry->hashHex, ChangeStatus::Added, false));

        if (oldTree && newTree) {
            diffSubtrees(path, oldEntry->hashHex, newEntry->hashHex, onChange);
        } else if (oldTree) {
            expand(path, oldEntry->hashHex, ChangeStatus::Removed, true, onChange);
        } else if (newTree) {
            expand(path, newEntry->hashHex, ChangeStatus::Added, false, onChange);
        }
    }
}

void TreeWalker::diffSubtrees(const std::string& path, const std::string& oldId, const std::string& newId,
                              const ChangeCallback& onChange) const {
    std::vector<TreeEntry> oldEntries;
    std::vector<TreeEntry> newEntries;
    bool oldOk = true;
    bool newOk = true;
    try {
        oldEntries = store.readTree(oldId);
    } catch (const ObjectStoreError& e) {
        Logger::instance().debug("Unreadable subtree " + path + ": " + e.what());
        oldOk = false;
    }
    try {
        newEntries = store.readTree(newId);
    } catch (const ObjectStoreError& e) {
        Logger::instance().debug("Unreadable subtree " + path + ": " + e.what());
        newOk = false;
    }

    if (oldOk && newOk) {
        diffEntries(path, oldEntries, newEntries, onChange);
    } else if (newOk) {
        emitLeaves(path, newEntries, ChangeStatus::Unknown, false, onChange);
    } else if (oldOk) {
        emitLeaves(path, oldEntries, ChangeStatus::Unknown, true, onChange);
    } else {
        TreeChange change;
        change.path = path;
        change.status = ChangeStatus::Unknown;
        onChange(change);
    }
}

void TreeWalker::expand(const std::string& path, const std::string& treeId, ChangeStatus status, bool oldSide,
                        const ChangeCallback& onChange) const {
    std::vector<TreeEntry> entries;
    try {
        entries = store.readTree(treeId);
    } catch (const ObjectStoreError& e) {
        Logger::instance().debug("Unreadable subtree " + path + ": " + e.what());
        onChange(makeChange(path, std::string(), ChangeStatus::Unknown, oldSide));
        return;
    }
    emitLeaves(path, entries, status, oldSide, onChange);
}

void TreeWalker::emitLeaves(const std::string& prefix, const std::vector<TreeEntry>& entries, ChangeStatus status,
                            bool oldSide, const ChangeCallback& onChange) const {
    std::map<std::string, const TreeEntry*> byName;
    for (const auto& entry : entries) {
        if (!entry.isGitlink()) byName[entry.name] = &entry;
    }
    for (const auto& [name, entry] : byName) {
        std::string path = joinPath(prefix, name);
        if (entry->isTree()) {
            expand(path, entry->hashHex, status, oldSide, onChange);
        } else {
            onChange(makeChange(path, entry->hashHex, status, oldSide));
        }
    }
}

Expected<void> TreeWalker::walkTree(const std::string& tree, const LeafCallback& onLeaf) const {
    std::vector<TreeEntry> entries;
    try {
        entries = store.readTree(tree);
    } catch (const ObjectStoreError& e) {
        return Error{e.code(), std::string("Cannot read tree: ") + e.what()};
    }
    walkEntries("", entries, onLeaf);
    return {};
}

void TreeWalker::walkEntries(const std::string& prefix, const std::vector<TreeEntry>& entries,
                             const LeafCallback& onLeaf) const {
    std::map<std::string, const TreeEntry*> byName;
    for (const auto& entry : entries) {
        if (!entry.isGitlink()) byName[entry.name] = &entry;
    }
    for (const auto& [name, entry] : byName) {
        std::string path = joinPath(prefix, name);
        if (!entry->isTree()) {
            onLeaf(path, *entry);
            continue;
        }
        std::vector<TreeEntry> children;
        try {
            children = store.readTree(entry->hashHex);
        } catch (const ObjectStoreError& e) {
            Logger::instance().debug("Skipping unreadable subtree " + path + ": " + e.what());
            continue;
        }
        walkEntries(path, children, onLeaf);
    }
}

}
