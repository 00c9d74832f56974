#include "engine/DiffEngine.hpp"

#include <string_view>
#include <unordered_map>

#include "core/Constants.hpp"
#include "engine/BinaryClassifier.hpp"
#include "util/Logger.hpp"

namespace gitpulse {

namespace {
    FileDelta baseDelta(const TreeChange& change) {
        FileDelta delta;
        delta.filename = change.path;
        delta.sha = change.newId.empty() ? change.oldId : change.newId;
        delta.status = change.status;
        return delta;
    }

    void finish(FileDelta& delta, int64_t additions, int64_t deletions) {
        delta.additions = additions;
        delta.deletions = deletions;
        delta.changes = additions + deletions;
    }

    int64_t oneUnlessEmpty(const std::string& blobId) {
        return blobId == Constants::EMPTY_BLOB_ID ? 0 : 1;
    }

    std::unordered_map<std::string_view, int64_t> lineCounts(const std::string& content) {
        std::unordered_map<std::string_view, int64_t> counts;
        std::string_view view(content);
        size_t start = 0;
        while (true) {
            size_t eol = view.find('\n', start);
            if (eol == std::string_view::npos) {
                ++counts[view.substr(start)];
                break;
            }
            ++counts[view.substr(start, eol - start)];
            start = eol + 1;
        }
        return counts;
    }
}

FileDelta FastDiffStrategy::measure(const TreeChange& change) const {
    FileDelta delta = baseDelta(change);
    switch (change.status) {
        case ChangeStatus::Added:
            finish(delta, oneUnlessEmpty(change.newId), 0);
            break;
        case ChangeStatus::Removed:
            finish(delta, 0, oneUnlessEmpty(change.oldId));
            break;
        case ChangeStatus::Modified:
            finish(delta, 1, 1);
            break;
        case ChangeStatus::Unknown:
            finish(delta, 0, 0);
            break;
    }
    return delta;
}

FileDelta FullDiffStrategy::measure(const TreeChange& change) const {
    FileDelta delta = baseDelta(change);
    switch (change.status) {
        case ChangeStatus::Added:
            finish(delta, BinaryClassifier::countTextLines(store.readBlob(change.newId)), 0);
            break;
        case ChangeStatus::Removed:
            finish(delta, 0, BinaryClassifier::countTextLines(store.readBlob(change.oldId)));
            break;
        case ChangeStatus::Modified: {
            std::string oldContent = store.readBlob(change.oldId);
            std::string newContent = store.readBlob(change.newId);
            if (BinaryClassifier::isBinary(oldContent) || BinaryClassifier::isBinary(newContent)) {
                finish(delta, 0, 0);
            } else {
                LineDelta lines = DiffEngine::lineDiff(oldContent, newContent);
                finish(delta, lines.additions, lines.deletions);
            }
            break;
        }
        case ChangeStatus::Unknown:
            finish(delta, 0, 0);
            break;
    }
    return delta;
}

DiffEngine::DiffEngine(const ObjectStore& store) : store(store), walker(store), full(store) {}

const IDiffStrategy& DiffEngine::strategy(DiffMode mode) const {
    if (mode == DiffMode::Full) return full;
    return fast;
}

LineDelta DiffEngine::lineDiff(const std::string& oldContent, const std::string& newContent) {
    auto oldCounts = lineCounts(oldContent);
    auto newCounts = lineCounts(newContent);

    LineDelta delta;
    for (const auto& [line, count] : newCounts) {
        auto it = oldCounts.find(line);
        int64_t before = it == oldCounts.end() ? 0 : it->second;
        if (count > before) delta.additions += count - before;
    }
    for (const auto& [line, count] : oldCounts) {
        auto it = newCounts.find(line);
        int64_t after = it == newCounts.end() ? 0 : it->second;
        if (count > after) delta.deletions += count - after;
    }
    return delta;
}

Expected<std::vector<TreeChange>> DiffEngine::collectChanges(const CommitObject& commit) const {
    const std::string* parent = commit.firstParent();
    if (!parent) {
        return walker.changes(std::string(), commit.treeHash);
    }

    std::string parentTree;
    try {
        parentTree = store.readCommit(*parent).treeHash;
    } catch (const ObjectStoreError& e) {
        Logger::instance().debug("Parent of " + commit.shortHash() + " unreadable: " + e.what());
        std::vector<TreeChange> unknown;
        auto walked = walker.walkTree(commit.treeHash, [&unknown](const std::string& path, const TreeEntry& entry) {
            TreeChange change;
            change.path = path;
            change.newId = entry.hashHex;
            change.status = ChangeStatus::Unknown;
            unknown.push_back(change);
        });
        if (!walked) return walked.error();
        return unknown;
    }
    return walker.changes(parentTree, commit.treeHash);
}

Expected<CommitDetail> DiffEngine::diffCommit(const CommitObject& commit, DiffMode mode) const {
    auto changes = collectChanges(commit);
    if (!changes) {
        return Error{changes.error().code, commit.shortHash() + ": " + changes.error().message};
    }

    const IDiffStrategy& measurer = strategy(mode);
    CommitDetail detail;
    detail.sha = commit.hash;
    detail.message = commit.message;
    detail.author = authorSignature(commit);
    detail.authorLogin = commit.authorName;
    detail.diffMode = measurer.mode();

    try {
        for (const auto& change : changes.value()) {
            FileDelta delta = measurer.measure(change);
            detail.stats.additions += delta.additions;
            detail.stats.deletions += delta.deletions;
            detail.files.push_back(std::move(delta));
        }
    } catch (const ObjectStoreError& e) {
        return Error{e.code(), commit.shortHash() + ": " + e.what()};
    }
    detail.stats.total = detail.stats.additions + detail.stats.deletions;
    return detail;
}

}
