#include "core/Repository.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitpulse {

namespace {
    bool looksLikeGitDir(const fs::path& dir) {
        std::error_code ec;
        return fs::is_directory(dir / "objects", ec) && fs::exists(dir / "HEAD", ec);
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return std::string();
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    Expected<std::string> readFirstLine(const fs::path& path) {
        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to read " + path.string()};
        }
        std::string line;
        std::getline(in, line);
        return trim(line);
    }
}

Repository::Repository(fs::path gitDir, std::unique_ptr<ObjectStore> store)
    : gitDirPath(std::move(gitDir)), store(std::move(store)) {}

Expected<std::unique_ptr<Repository>> Repository::open(const fs::path& path) {
    std::error_code ec;
    fs::path root = fs::absolute(path, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgs, "Invalid path: " + path.string()};
    }

    fs::path gitDir;
    if (looksLikeGitDir(root / ".git")) {
        gitDir = root / ".git";
    } else if (looksLikeGitDir(root)) {
        gitDir = root;
    } else {
        return Error{ErrorCode::NotARepository, "Not a git repository: " + root.string()};
    }

    try {
        auto store = std::make_unique<ObjectStore>(gitDir / "objects");
        Logger::instance().debug("Opened repository " + gitDir.string() + " with " +
                                 std::to_string(store->packCount()) + " pack(s)");
        return std::unique_ptr<Repository>(new Repository(gitDir, std::move(store)));
    } catch (const ObjectStoreError& e) {
        return Error{e.code(), e.what()};
    }
}

Expected<std::string> Repository::resolveRef(const std::string& refName) const {
    fs::path refFile = gitDirPath / refName;
    std::error_code ec;
    if (fs::is_regular_file(refFile, ec)) {
        auto line = readFirstLine(refFile);
        if (!line) return line.error();
        if (line.value().rfind("ref: ", 0) == 0) {
            return resolveRef(line.value().substr(5));
        }
        if (!line.value().empty()) return line.value();
    }

    // packed-refs: "<id> <refname>" lines, '#' header, '^' peeled lines
    fs::path packedRefs = gitDirPath / "packed-refs";
    if (fs::exists(packedRefs, ec)) {
        std::ifstream in(packedRefs);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to read packed-refs"};
        }
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == '^') continue;
            size_t space = line.find(' ');
            if (space == std::string::npos) continue;
            if (line.substr(space + 1) == refName) {
                return line.substr(0, space);
            }
        }
    }
    return Error{ErrorCode::RefNotFound, "Reference not found: " + refName};
}

Expected<std::string> Repository::resolveHead() const {
    auto head = readFirstLine(gitDirPath / "HEAD");
    if (!head) return head.error();

    const std::string& content = head.value();
    if (content.rfind("ref: ", 0) == 0) {
        return resolveRef(content.substr(5));
    }
    // Detached HEAD
    if (content.size() != Constants::SHA1_HEX_LENGTH) {
        return Error{ErrorCode::CorruptObject, "Malformed HEAD: " + content};
    }
    return content;
}

Expected<std::string> Repository::peelToCommit(const std::string& id) const {
    std::string current = id;
    // Tags can point at tags
    for (int hops = 0; hops < 16; ++hops) {
        RawObject obj;
        try {
            obj = store->readObject(current);
        } catch (const ObjectStoreError& e) {
            return Error{e.code(), e.what()};
        }
        if (obj.type == ObjectType::Commit) return current;
        if (obj.type != ObjectType::Tag) {
            return Error{ErrorCode::InvalidArgs, current + " is not a commit"};
        }
        std::istringstream tag(obj.payload);
        std::string line;
        std::getline(tag, line);
        if (line.rfind("object ", 0) != 0) {
            return Error{ErrorCode::CorruptObject, "Malformed tag " + current};
        }
        current = line.substr(7);
    }
    return Error{ErrorCode::CorruptObject, "Tag chain too long at " + id};
}

Expected<std::vector<CommitObject>> Repository::firstParentHistory(const std::string& tip, size_t maxCount) const {
    auto start = peelToCommit(tip);
    if (!start) return start.error();

    std::vector<CommitObject> history;
    std::string current = start.value();
    while (history.size() < maxCount) {
        try {
            history.push_back(store->readCommit(current));
        } catch (const ObjectStoreError& e) {
            if (history.empty()) {
                return Error{e.code(), e.what()};
            }
            // Shallow clones end at a parent that was never fetched
            if (e.code() == ErrorCode::ObjectNotFound) {
                Logger::instance().debug("History stops at missing commit " + current);
                break;
            }
            return Error{e.code(), e.what()};
        }
        const std::string* parent = history.back().firstParent();
        if (!parent) break;
        current = *parent;
    }
    return history;
}

}
