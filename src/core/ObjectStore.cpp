#include "core/ObjectStore.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "core/PackFile.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"
#include "util/Zlib.hpp"

namespace fs = std::filesystem;

namespace gitpulse {

namespace {
    // Longest delta chain we follow before declaring the pack corrupt
    constexpr int MAX_DELTA_DEPTH = 4096;

    ObjectType typeFromName(const std::string& name) {
        if (name == "commit") return ObjectType::Commit;
        if (name == "tree") return ObjectType::Tree;
        if (name == "blob") return ObjectType::Blob;
        if (name == "tag") return ObjectType::Tag;
        return ObjectType::None;
    }

    std::string readFileBytes(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw ObjectStoreError(ErrorCode::IoError, "Failed to open " + path.string());
        }
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    bool isHexId(const std::string& hash) {
        if (hash.size() != Constants::SHA1_HEX_LENGTH) return false;
        return std::all_of(hash.begin(), hash.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }

    // "Name <email> 1700000000 +0100"
    void parseSignature(const std::string& line, std::string& name, std::string& email,
                        int64_t& timestamp, std::string& timezone) {
        size_t emailStart = line.find('<');
        size_t emailEnd = line.rfind('>');
        if (emailStart == std::string::npos || emailEnd == std::string::npos || emailEnd < emailStart) {
            name = line;
            return;
        }
        name = line.substr(0, emailStart);
        while (!name.empty() && name.back() == ' ') name.pop_back();
        email = line.substr(emailStart + 1, emailEnd - emailStart - 1);

        std::string rest = emailEnd + 1 < line.size() ? line.substr(emailEnd + 1) : std::string();
        size_t tsStart = rest.find_first_not_of(' ');
        if (tsStart == std::string::npos) return;
        size_t tsEnd = rest.find(' ', tsStart);
        std::string ts = rest.substr(tsStart, tsEnd == std::string::npos ? std::string::npos : tsEnd - tsStart);
        try {
            timestamp = std::stoll(ts);
        } catch (const std::exception&) {
            throw ObjectStoreError(ErrorCode::CorruptObject, "Invalid timestamp in signature: " + line);
        }
        if (tsEnd != std::string::npos) {
            timezone = rest.substr(tsEnd + 1);
        }
    }
}

const char* objectTypeName(ObjectType type) {
    switch (type) {
        case ObjectType::Commit: return "commit";
        case ObjectType::Tree: return "tree";
        case ObjectType::Blob: return "blob";
        case ObjectType::Tag: return "tag";
        case ObjectType::None: break;
    }
    return "none";
}

bool TreeEntry::isTree() const {
    return (mode & 0170000) == Constants::MODE_DIR;
}

bool TreeEntry::isGitlink() const {
    return (mode & 0170000) == Constants::MODE_GITLINK;
}

bool TreeEntry::isBlob() const {
    return !isTree() && !isGitlink();
}

ObjectStore::ObjectStore(const fs::path& objectsDir, std::unique_ptr<IHasher> hasher)
    : objectsRoot(objectsDir), hasher(hasher ? std::move(hasher) : HasherFactory::createDefault()) {
    fs::path packDir = objectsRoot / "pack";
    std::error_code ec;
    if (!fs::is_directory(packDir, ec)) {
        return;
    }

    // Sorted so lookup order does not depend on directory iteration order
    std::vector<fs::path> indexes;
    for (const auto& entry : fs::directory_iterator(packDir, ec)) {
        if (entry.path().extension() == ".idx") {
            indexes.push_back(entry.path());
        }
    }
    std::sort(indexes.begin(), indexes.end());

    for (const auto& idxPath : indexes) {
        packs.push_back(PackFile::open(idxPath, this->hasher->digestSize()));
        Logger::instance().debug("Loaded pack " + idxPath.filename().string() + " (" +
                                 std::to_string(packs.back()->objectCount()) + " objects)");
    }
}

ObjectStore::~ObjectStore() = default;

fs::path ObjectStore::getObjectPath(const std::string& hash) const {
    if (hash.length() < Constants::OBJECT_DIR_LENGTH + 1) {
        throw ObjectStoreError(ErrorCode::InvalidArgs, "Invalid hash length: " + hash);
    }
    std::string dir = hash.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string file = hash.substr(Constants::OBJECT_DIR_LENGTH);
    return objectsRoot / dir / file;
}

bool ObjectStore::contains(const std::string& hash) const {
    if (!isHexId(hash)) return false;
    std::error_code ec;
    if (fs::exists(getObjectPath(hash), ec)) return true;
    return std::any_of(packs.begin(), packs.end(),
                       [&hash](const std::unique_ptr<PackFile>& pack) { return pack->contains(hash); });
}

RawObject ObjectStore::readObject(const std::string& hash) const {
    if (!isHexId(hash)) {
        throw ObjectStoreError(ErrorCode::InvalidArgs, "Invalid object id: " + hash);
    }
    std::error_code ec;
    if (fs::exists(getObjectPath(hash), ec)) {
        return readLoose(hash);
    }
    return readPacked(hash, 0);
}

RawObject ObjectStore::readLoose(const std::string& hash) const {
    std::string compressed = readFileBytes(getObjectPath(hash));

    std::string data;
    try {
        data = zlib::decompress(reinterpret_cast<const uint8_t*>(compressed.data()), compressed.size());
    } catch (const std::runtime_error& e) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Loose object " + hash + ": " + e.what());
    }

    // Header: "<type> <size>\0"
    size_t nullPos = data.find('\0');
    size_t spacePos = data.find(' ');
    if (nullPos == std::string::npos || spacePos == std::string::npos || spacePos > nullPos) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Invalid object header: " + hash);
    }

    RawObject obj;
    obj.type = typeFromName(data.substr(0, spacePos));
    if (obj.type == ObjectType::None) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Unknown object type in " + hash);
    }
    size_t declared = 0;
    try {
        declared = static_cast<size_t>(std::stoull(data.substr(spacePos + 1, nullPos - spacePos - 1)));
    } catch (const std::exception&) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Invalid object size in " + hash);
    }
    obj.payload = data.substr(nullPos + 1);
    if (obj.payload.size() != declared) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Object size mismatch in " + hash);
    }
    return obj;
}

RawObject ObjectStore::readPacked(const std::string& hash, int depth) const {
    if (depth > MAX_DELTA_DEPTH) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Delta chain too deep at " + hash);
    }
    for (const auto& pack : packs) {
        auto offset = pack->findOffset(hash);
        if (!offset) continue;
        // REF_DELTA bases may live loose or in another pack
        return pack->readAt(*offset, [this, depth](const std::string& baseId) {
            std::error_code ec;
            if (fs::exists(getObjectPath(baseId), ec)) {
                return readLoose(baseId);
            }
            return readPacked(baseId, depth + 1);
        });
    }
    throw ObjectStoreError(ErrorCode::ObjectNotFound, "Object not found: " + hash);
}

std::string ObjectStore::readBlob(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != ObjectType::Blob) {
        throw ObjectStoreError(ErrorCode::CorruptObject,
                               "Expected blob, got " + std::string(objectTypeName(obj.type)) + ": " + hash);
    }
    return std::move(obj.payload);
}

std::vector<TreeEntry> ObjectStore::readTree(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != ObjectType::Tree) {
        throw ObjectStoreError(ErrorCode::CorruptObject,
                               "Expected tree, got " + std::string(objectTypeName(obj.type)) + ": " + hash);
    }
    return parseTree(obj.payload, hasher->digestSize());
}

CommitObject ObjectStore::readCommit(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != ObjectType::Commit) {
        throw ObjectStoreError(ErrorCode::CorruptObject,
                               "Expected commit, got " + std::string(objectTypeName(obj.type)) + ": " + hash);
    }
    return parseCommit(hash, obj.payload);
}

std::vector<TreeEntry> ObjectStore::parseTree(const std::string& payload, size_t idSize) {
    // Format: <octal mode> <name>\0<raw id>
    std::vector<TreeEntry> entries;
    size_t pos = 0;
    while (pos < payload.size()) {
        size_t spacePos = payload.find(' ', pos);
        if (spacePos == std::string::npos) {
            throw ObjectStoreError(ErrorCode::CorruptObject, "Truncated tree entry mode");
        }
        size_t nullPos = payload.find('\0', spacePos + 1);
        if (nullPos == std::string::npos || nullPos + idSize >= payload.size()) {
            throw ObjectStoreError(ErrorCode::CorruptObject, "Truncated tree entry");
        }

        TreeEntry entry;
        uint32_t mode = 0;
        for (size_t i = pos; i < spacePos; ++i) {
            char c = payload[i];
            if (c < '0' || c > '7') {
                throw ObjectStoreError(ErrorCode::CorruptObject, "Invalid tree entry mode");
            }
            mode = mode * 8 + static_cast<uint32_t>(c - '0');
        }
        entry.mode = mode;
        entry.name = payload.substr(spacePos + 1, nullPos - spacePos - 1);
        entry.hashHex = IHasher::toHex(reinterpret_cast<const uint8_t*>(payload.data() + nullPos + 1), idSize);
        entries.push_back(std::move(entry));

        pos = nullPos + 1 + idSize;
    }
    return entries;
}

CommitObject ObjectStore::parseCommit(const std::string& hash, const std::string& payload) {
    CommitObject commit;
    commit.hash = hash;

    size_t pos = 0;
    while (pos < payload.size()) {
        size_t eol = payload.find('\n', pos);
        if (eol == std::string::npos) eol = payload.size();
        std::string line = payload.substr(pos, eol - pos);
        pos = eol + 1;

        // Blank line separates headers from the message
        if (line.empty()) {
            if (pos < payload.size()) {
                commit.message = payload.substr(pos);
            }
            break;
        }
        // Continuation of a multi-line header (gpgsig, mergetag)
        if (line[0] == ' ') continue;

        size_t space = line.find(' ');
        std::string key = line.substr(0, space);
        std::string value = space == std::string::npos ? std::string() : line.substr(space + 1);
        if (key == "tree") {
            commit.treeHash = value;
        } else if (key == "parent") {
            commit.parentHashes.push_back(value);
        } else if (key == "author") {
            parseSignature(value, commit.authorName, commit.authorEmail,
                           commit.authorTimestamp, commit.authorTimezone);
        } else if (key == "committer") {
            parseSignature(value, commit.committerName, commit.committerEmail,
                           commit.committerTimestamp, commit.committerTimezone);
        }
    }

    if (commit.treeHash.empty()) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Commit without tree: " + hash);
    }
    return commit;
}

std::string ObjectStore::writeObject(ObjectType type, const std::string& payload) {
    if (type == ObjectType::None) {
        throw ObjectStoreError(ErrorCode::InvalidArgs, "Cannot write an untyped object");
    }
    // Git object format: "<type> <size>\0<payload>"
    std::string fullObject = std::string(objectTypeName(type)) + " " + std::to_string(payload.size());
    fullObject += '\0';
    fullObject += payload;

    std::lock_guard<std::mutex> lock(writeMtx);
    hasher->reset();
    hasher->update(fullObject);
    std::string hash = IHasher::toHex(hasher->digest());

    fs::path objPath = getObjectPath(hash);
    if (fs::exists(objPath)) {
        return hash;
    }

    std::error_code ec;
    fs::create_directories(objPath.parent_path(), ec);
    if (ec) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to create object directory: " + ec.message());
    }

    std::string compressed = zlib::compress(fullObject);
    std::ofstream out(objPath, std::ios::binary);
    if (!out) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to open object file for writing: " + hash);
    }
    out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
    if (!out) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to write object: " + hash);
    }
    return hash;
}

std::string ObjectStore::writeTree(std::vector<TreeEntry> entries) {
    // Git orders entries as if directory names ended with '/'
    auto sortKey = [](const TreeEntry& e) { return e.isTree() ? e.name + "/" : e.name; };
    std::sort(entries.begin(), entries.end(),
              [&sortKey](const TreeEntry& a, const TreeEntry& b) { return sortKey(a) < sortKey(b); });

    std::string payload;
    for (const auto& entry : entries) {
        char modeBuf[16];
        std::snprintf(modeBuf, sizeof(modeBuf), "%o", entry.mode);
        payload += modeBuf;
        payload += ' ';
        payload += entry.name;
        payload += '\0';
        std::vector<uint8_t> raw;
        try {
            raw = IHasher::fromHex(entry.hashHex);
        } catch (const std::invalid_argument&) {
            throw ObjectStoreError(ErrorCode::InvalidArgs, "Invalid tree entry id: " + entry.hashHex);
        }
        payload.append(reinterpret_cast<const char*>(raw.data()), raw.size());
    }
    return writeObject(ObjectType::Tree, payload);
}

}
