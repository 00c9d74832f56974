#include "core/PackFile.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "util/IHasher.hpp"
#include "util/Zlib.hpp"

namespace fs = std::filesystem;

namespace gitpulse {

namespace {
    constexpr uint8_t IDX_MAGIC[4] = {0xff, 't', 'O', 'c'};
    constexpr size_t IDX_HEADER_SIZE = 8;
    constexpr size_t FANOUT_SIZE = 256 * 4;
    constexpr size_t PACK_HEADER_SIZE = 12;
    constexpr int MAX_DELTA_DEPTH = 4096;

    std::vector<uint8_t> loadFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw ObjectStoreError(ErrorCode::IoError, "Failed to open " + path.string());
        }
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    ObjectStoreError corrupt(const fs::path& path, const std::string& what) {
        return ObjectStoreError(ErrorCode::CorruptObject, path.filename().string() + ": " + what);
    }

    // Little-endian base-128 size used by delta headers
    size_t readDeltaSize(const std::string& delta, size_t& pos) {
        size_t value = 0;
        int shift = 0;
        while (true) {
            if (pos >= delta.size() || shift > 63) {
                throw ObjectStoreError(ErrorCode::CorruptObject, "Truncated delta header");
            }
            uint8_t c = static_cast<uint8_t>(delta[pos++]);
            value |= static_cast<size_t>(c & 0x7f) << shift;
            shift += 7;
            if (!(c & 0x80)) break;
        }
        return value;
    }

    ObjectType toObjectType(uint8_t entryType) {
        switch (entryType) {
            case PackFile::ENTRY_COMMIT: return ObjectType::Commit;
            case PackFile::ENTRY_TREE: return ObjectType::Tree;
            case PackFile::ENTRY_BLOB: return ObjectType::Blob;
            case PackFile::ENTRY_TAG: return ObjectType::Tag;
            default: return ObjectType::None;
        }
    }
}

std::unique_ptr<PackFile> PackFile::open(const fs::path& idxPath, size_t idSize) {
    std::unique_ptr<PackFile> pf(new PackFile());
    pf->idSize = idSize;
    pf->path = idxPath;
    pf->path.replace_extension(".pack");
    pf->idx = loadFile(idxPath);
    pf->pack = loadFile(pf->path);

    const auto& idx = pf->idx;
    if (idx.size() < IDX_HEADER_SIZE + FANOUT_SIZE + 2 * idSize) {
        throw corrupt(idxPath, "index too small");
    }
    if (std::memcmp(idx.data(), IDX_MAGIC, sizeof(IDX_MAGIC)) != 0) {
        throw corrupt(idxPath, "unsupported index format (only version 2 is read)");
    }
    if (pf->readBe32(idx, 4) != 2) {
        throw corrupt(idxPath, "unsupported index version");
    }

    uint32_t previous = 0;
    for (size_t i = 0; i < 256; ++i) {
        pf->fanout[i] = pf->readBe32(idx, IDX_HEADER_SIZE + i * 4);
        if (pf->fanout[i] < previous) {
            throw corrupt(idxPath, "fanout table is not monotonic");
        }
        previous = pf->fanout[i];
    }
    pf->count = pf->fanout[255];

    pf->namesOffset = IDX_HEADER_SIZE + FANOUT_SIZE;
    size_t crcOffset = pf->namesOffset + pf->count * idSize;
    pf->offsetsOffset = crcOffset + pf->count * 4;
    pf->largeOffsetsOffset = pf->offsetsOffset + pf->count * 4;
    if (pf->largeOffsetsOffset + 2 * idSize > idx.size()) {
        throw corrupt(idxPath, "index truncated");
    }

    const auto& pack = pf->pack;
    if (pack.size() < PACK_HEADER_SIZE + idSize || std::memcmp(pack.data(), "PACK", 4) != 0) {
        throw corrupt(pf->path, "missing PACK signature");
    }
    uint32_t version = pf->readBe32(pack, 4);
    if (version != 2 && version != 3) {
        throw corrupt(pf->path, "unsupported pack version " + std::to_string(version));
    }
    if (pf->readBe32(pack, 8) != pf->count) {
        throw corrupt(pf->path, "object count disagrees with index");
    }
    return pf;
}

uint32_t PackFile::readBe32(const std::vector<uint8_t>& buf, size_t pos) const {
    return (static_cast<uint32_t>(buf[pos]) << 24) | (static_cast<uint32_t>(buf[pos + 1]) << 16) |
           (static_cast<uint32_t>(buf[pos + 2]) << 8) | static_cast<uint32_t>(buf[pos + 3]);
}

std::optional<uint64_t> PackFile::findOffset(const std::string& hexId) const {
    std::vector<uint8_t> raw;
    try {
        raw = IHasher::fromHex(hexId);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (raw.size() != idSize) return std::nullopt;

    // Names sharing the first byte sit in [fanout[b-1], fanout[b])
    size_t lo = raw[0] == 0 ? 0 : fanout[raw[0] - 1];
    size_t hi = fanout[raw[0]];
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        int cmp = std::memcmp(idx.data() + namesOffset + mid * idSize, raw.data(), idSize);
        if (cmp == 0) {
            uint32_t off32 = readBe32(idx, offsetsOffset + mid * 4);
            if (!(off32 & 0x80000000u)) {
                return off32;
            }
            size_t large = largeOffsetsOffset + static_cast<size_t>(off32 & 0x7fffffffu) * 8;
            if (large + 8 > idx.size() - 2 * idSize) {
                throw corrupt(path, "large offset out of range");
            }
            return (static_cast<uint64_t>(readBe32(idx, large)) << 32) | readBe32(idx, large + 4);
        }
        if (cmp < 0) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return std::nullopt;
}

RawObject PackFile::readAt(uint64_t offset, const BaseResolver& resolveRef) const {
    return readAt(offset, resolveRef, 0);
}

RawObject PackFile::readAt(uint64_t offset, const BaseResolver& resolveRef, int depth) const {
    if (depth > MAX_DELTA_DEPTH) {
        throw corrupt(path, "delta chain too deep");
    }
    // The trailing checksum is not entry data
    size_t end = pack.size() - idSize;
    if (offset < PACK_HEADER_SIZE || offset >= end) {
        throw corrupt(path, "entry offset out of range");
    }

    size_t pos = static_cast<size_t>(offset);
    uint8_t c = pack[pos++];
    uint8_t type = (c >> 4) & 0x7;
    uint64_t size = c & 0x0f;
    int shift = 4;
    while (c & 0x80) {
        if (pos >= end || shift > 57) throw corrupt(path, "truncated entry header");
        c = pack[pos++];
        size |= static_cast<uint64_t>(c & 0x7f) << shift;
        shift += 7;
    }

    RawObject base;
    if (type == ENTRY_OFS_DELTA) {
        if (pos >= end) throw corrupt(path, "truncated delta offset");
        c = pack[pos++];
        uint64_t negative = c & 0x7f;
        while (c & 0x80) {
            if (pos >= end) throw corrupt(path, "truncated delta offset");
            c = pack[pos++];
            negative = ((negative + 1) << 7) | (c & 0x7f);
        }
        if (negative == 0 || negative > offset) {
            throw corrupt(path, "delta base offset out of range");
        }
        base = readAt(offset - negative, resolveRef, depth + 1);
    } else if (type == ENTRY_REF_DELTA) {
        if (pos + idSize > end) throw corrupt(path, "truncated delta base id");
        std::string baseId = IHasher::toHex(pack.data() + pos, idSize);
        pos += idSize;
        auto baseOffset = findOffset(baseId);
        base = baseOffset ? readAt(*baseOffset, resolveRef, depth + 1) : resolveRef(baseId);
    } else if (toObjectType(type) == ObjectType::None) {
        throw corrupt(path, "invalid entry type " + std::to_string(type));
    }

    std::string data;
    try {
        data = zlib::decompress(pack.data() + pos, end - pos, nullptr, static_cast<size_t>(size));
    } catch (const std::runtime_error& e) {
        throw corrupt(path, std::string("entry inflate failed: ") + e.what());
    }
    if (data.size() != size) {
        throw corrupt(path, "entry size mismatch");
    }

    if (type == ENTRY_OFS_DELTA || type == ENTRY_REF_DELTA) {
        RawObject obj;
        obj.type = base.type;
        obj.payload = applyDelta(base.payload, data);
        return obj;
    }

    RawObject obj;
    obj.type = toObjectType(type);
    obj.payload = std::move(data);
    return obj;
}

std::string PackFile::applyDelta(const std::string& base, const std::string& delta) {
    size_t pos = 0;
    size_t sourceSize = readDeltaSize(delta, pos);
    size_t targetSize = readDeltaSize(delta, pos);
    if (sourceSize != base.size()) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Delta source size mismatch");
    }

    std::string out;
    out.reserve(targetSize);
    while (pos < delta.size()) {
        uint8_t cmd = static_cast<uint8_t>(delta[pos++]);
        if (cmd & 0x80) {
            size_t copyOffset = 0;
            size_t copySize = 0;
            for (int i = 0; i < 4; ++i) {
                if (cmd & (1u << i)) {
                    if (pos >= delta.size()) throw ObjectStoreError(ErrorCode::CorruptObject, "Truncated copy command");
                    copyOffset |= static_cast<size_t>(static_cast<uint8_t>(delta[pos++])) << (8 * i);
                }
            }
            for (int i = 0; i < 3; ++i) {
                if (cmd & (0x10u << i)) {
                    if (pos >= delta.size()) throw ObjectStoreError(ErrorCode::CorruptObject, "Truncated copy command");
                    copySize |= static_cast<size_t>(static_cast<uint8_t>(delta[pos++])) << (8 * i);
                }
            }
            if (copySize == 0) copySize = 0x10000;
            if (copyOffset > base.size() || copySize > base.size() - copyOffset) {
                throw ObjectStoreError(ErrorCode::CorruptObject, "Delta copy out of range");
            }
            out.append(base, copyOffset, copySize);
        } else if (cmd != 0) {
            if (cmd > delta.size() - pos) {
                throw ObjectStoreError(ErrorCode::CorruptObject, "Delta insert out of range");
            }
            out.append(delta, pos, cmd);
            pos += cmd;
        } else {
            // Opcode 0 is reserved
            throw ObjectStoreError(ErrorCode::CorruptObject, "Reserved delta opcode");
        }
    }

    if (out.size() != targetSize) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Delta target size mismatch");
    }
    return out;
}

}
