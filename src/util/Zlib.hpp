#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gitpulse::zlib {

/// Deflate a buffer at the default level (loose objects, pack entries)
std::string compress(const std::string& data);

/**
 * @brief Inflate one zlib stream starting at @p data
 *
 * Stops at the end of the stream, so trailing bytes (the next pack
 * entry) are left alone. When @p consumed is non-null it receives the
 * number of compressed bytes the stream occupied. @p sizeHint only
 * pre-sizes the output buffer.
 *
 * Throws std::runtime_error on a corrupt or truncated stream.
 */
std::string decompress(const uint8_t* data, size_t len, size_t* consumed = nullptr, size_t sizeHint = 0);

/// CRC-32 as stored in pack index files
uint32_t crc32(const uint8_t* data, size_t len);

}
