#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"

namespace gitpulse {

class IHasher;
class PackFile;

enum class ObjectType { None = 0, Commit = 1, Tree = 2, Blob = 3, Tag = 4 };

const char* objectTypeName(ObjectType type);

/// Decoded object: type plus the payload that follows the "<type> <size>\0" header
struct RawObject {
    ObjectType type{ObjectType::None};
    std::string payload;
};

/**
 * @brief Tree entry: one file, symlink, submodule or subdirectory
 *
 * Git tree format:
 *   <octal mode> <name>\0<20-byte-sha1>
 */
struct TreeEntry {
    uint32_t mode{0};
    std::string name;
    std::string hashHex;

    bool isTree() const;
    bool isGitlink() const;
    /// Regular file, executable or symlink: anything whose id names a blob
    bool isBlob() const;
};

/// Thrown by the object store for missing or malformed objects
class ObjectStoreError : public std::runtime_error {
public:
    ObjectStoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Read access to a repository's object database
 *
 * Looks objects up in the loose layout first:
 *   objects/<first-2-chars>/<remaining-38-chars>   (zlib "<type> <size>\0<payload>")
 * then in every pack under objects/pack/ (see PackFile).
 *
 * Pack files are loaded into memory when the store is constructed and are
 * immutable afterwards, so concurrent reads from the batch executor's
 * threads are safe. Loose writes are serialized by a mutex; they exist so
 * fixtures and tools can build repositories without a git binary.
 */
class ObjectStore {
public:
    /**
     * @param objectsDir The repository's objects/ directory
     * @param hasher Hash algorithm (defaults to SHA-1 if nullptr)
     * @throws ObjectStoreError if a pack index in objects/pack is unreadable or corrupt
     */
    explicit ObjectStore(const std::filesystem::path& objectsDir, std::unique_ptr<IHasher> hasher = nullptr);
    ~ObjectStore();

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    const std::filesystem::path& objectsDir() const { return objectsRoot; }

    /// Loose-object path for @p hash: objects/<aa>/<bbbb...>
    std::filesystem::path getObjectPath(const std::string& hash) const;

    size_t packCount() const { return packs.size(); }

    bool contains(const std::string& hash) const;

    /**
     * @brief Read and decode any object
     * @throws ObjectStoreError (ObjectNotFound, CorruptObject, IoError)
     */
    RawObject readObject(const std::string& hash) const;

    /// Blob payload; throws ObjectStoreError when missing or not a blob
    std::string readBlob(const std::string& hash) const;

    /// Tree entries in stored order; throws ObjectStoreError when missing or not a tree
    std::vector<TreeEntry> readTree(const std::string& hash) const;

    /// Parsed commit; throws ObjectStoreError when missing or not a commit
    CommitObject readCommit(const std::string& hash) const;

    /// Store a loose object, returns its hex id. Existing objects are left untouched.
    std::string writeObject(ObjectType type, const std::string& payload);
    std::string writeBlob(const std::string& content) { return writeObject(ObjectType::Blob, content); }
    std::string writeCommit(const std::string& content) { return writeObject(ObjectType::Commit, content); }

    /// Encode entries in git tree order and store the tree
    std::string writeTree(std::vector<TreeEntry> entries);

    /// Parse a tree payload whose binary ids are @p idSize bytes wide
    static std::vector<TreeEntry> parseTree(const std::string& payload, size_t idSize);

    /// Parse a commit payload
    static CommitObject parseCommit(const std::string& hash, const std::string& payload);

private:
    RawObject readLoose(const std::string& hash) const;
    RawObject readPacked(const std::string& hash, int depth) const;

    std::filesystem::path objectsRoot;
    std::unique_ptr<IHasher> hasher;
    std::vector<std::unique_ptr<PackFile>> packs;
    std::mutex writeMtx;
};

}
