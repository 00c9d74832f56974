#pragma once

#include <cstdint>
#include <string>

#include "core/Constants.hpp"

namespace gitpulse {

/**
 * @brief Text/binary heuristic shared by the diff engine and the census
 *
 * A blob is binary when a NUL byte appears in its first 8 KiB.
 * Binary blobs count as zero lines everywhere.
 */
class BinaryClassifier {
public:
    static bool isBinary(const std::string& content, size_t sniffBytes = Constants::BINARY_SNIFF_BYTES);

    /// Number of '\n' plus one when the content is non-empty and lacks a trailing newline
    static int64_t countLines(const std::string& content);

    /// countLines() for text, 0 for binary content
    static int64_t countTextLines(const std::string& content);
};

}
