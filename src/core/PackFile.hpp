#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/ObjectStore.hpp"

namespace gitpulse {

/**
 * @brief One pack/idx pair held in memory
 *
 * Index (version 2):
 *   "\377tOc" | version=2 | fanout[256] | names[N] | crc32[N] | offset32[N] | offset64[M] | trailer
 * A 32-bit offset with the MSB set is an index into the 64-bit table.
 *
 * Pack entries start with a varint header (3-bit type, size), followed by
 * either a zlib stream (commit/tree/blob/tag), a negative base offset plus
 * a zlib delta (OFS_DELTA), or a base object id plus a zlib delta (REF_DELTA).
 *
 * Both files are read completely on open and never modified afterwards.
 */
class PackFile {
public:
    /// Resolves a REF_DELTA base that may live outside this pack
    using BaseResolver = std::function<RawObject(const std::string& hexId)>;

    enum EntryType : uint8_t {
        ENTRY_COMMIT = 1,
        ENTRY_TREE = 2,
        ENTRY_BLOB = 3,
        ENTRY_TAG = 4,
        ENTRY_OFS_DELTA = 6,
        ENTRY_REF_DELTA = 7
    };

    /**
     * @brief Load an index and the pack next to it (same stem, .pack)
     * @param idxPath Path of the .idx file
     * @param idSize Binary object id width (20 for SHA-1)
     * @throws ObjectStoreError (IoError when unreadable, CorruptObject when malformed)
     */
    static std::unique_ptr<PackFile> open(const std::filesystem::path& idxPath, size_t idSize);

    size_t objectCount() const { return count; }
    const std::filesystem::path& packPath() const { return path; }

    /// Offset of @p hexId inside the pack, if the index lists it
    std::optional<uint64_t> findOffset(const std::string& hexId) const;
    bool contains(const std::string& hexId) const { return findOffset(hexId).has_value(); }

    /**
     * @brief Decode the entry at @p offset, resolving delta chains
     * @throws ObjectStoreError on malformed data or an unresolvable base
     */
    RawObject readAt(uint64_t offset, const BaseResolver& resolveRef) const;

    /**
     * @brief Apply a git delta to @p base
     *
     * Delta: <source size varint> <target size varint> then commands:
     *   1xxxxxxx  copy: offset/size bytes selected by the low 7 bits (size 0 = 0x10000)
     *   0nnnnnnn  insert the next n literal bytes (n > 0)
     *
     * @throws ObjectStoreError when sizes disagree or a command reads past its input
     */
    static std::string applyDelta(const std::string& base, const std::string& delta);

private:
    PackFile() = default;

    RawObject readAt(uint64_t offset, const BaseResolver& resolveRef, int depth) const;
    uint32_t readBe32(const std::vector<uint8_t>& buf, size_t pos) const;

    std::filesystem::path path;
    std::vector<uint8_t> idx;
    std::vector<uint8_t> pack;
    std::array<uint32_t, 256> fanout{};
    size_t count{0};
    size_t idSize{20};
    size_t namesOffset{0};
    size_t offsetsOffset{0};
    size_t largeOffsetsOffset{0};
};

}
