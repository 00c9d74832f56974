#include "util/Zlib.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

#include <zlib.h>

namespace gitpulse::zlib {

std::string compress(const std::string& data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
        throw std::runtime_error("zlib deflateInit failed");
    }

    std::string compressed;
    compressed.resize(deflateBound(&stream, static_cast<uLong>(data.size())));

    // Some zlib versions have non-const next_in
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(compressed.data());
    stream.avail_out = static_cast<uInt>(compressed.size());

    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&stream);
        throw std::runtime_error("zlib deflate failed");
    }

    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return compressed;
}

std::string decompress(const uint8_t* data, size_t len, size_t* consumed, size_t sizeHint) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }

    const size_t maxChunk = std::numeric_limits<uInt>::max();
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(len < maxChunk ? len : maxChunk);

    std::string out;
    out.reserve(sizeHint);
    std::vector<uint8_t> buffer(16384);

    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw std::runtime_error("zlib inflate failed");
        }
        size_t have = buffer.size() - stream.avail_out;
        out.append(reinterpret_cast<const char*>(buffer.data()), have);

        if (ret == Z_OK && stream.avail_in == 0 && have == 0) {
            inflateEnd(&stream);
            throw std::runtime_error("zlib stream truncated");
        }
    }

    if (consumed) {
        *consumed = static_cast<size_t>(stream.total_in);
    }
    inflateEnd(&stream);
    return out;
}

uint32_t crc32(const uint8_t* data, size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

}
