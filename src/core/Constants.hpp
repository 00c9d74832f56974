#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Constants used throughout the codebase
 *
 * Object format numbers and the engine's default tuning. Runtime
 * overrides go through EngineOptions.
 */
namespace gitpulse {

namespace Constants {
    // Object ids
    constexpr size_t SHA1_HEX_LENGTH = 40;
    constexpr size_t SHA1_RAW_LENGTH = 20;
    constexpr size_t OBJECT_DIR_LENGTH = 2;       // objects/<2 chars>/<38 chars>
    constexpr const char* EMPTY_BLOB_ID = "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391";

    // Tree entry modes (octal)
    constexpr uint32_t MODE_FILE = 0100644;
    constexpr uint32_t MODE_EXECUTABLE = 0100755;
    constexpr uint32_t MODE_SYMLINK = 0120000;
    constexpr uint32_t MODE_DIR = 0040000;
    constexpr uint32_t MODE_GITLINK = 0160000;

    // History extraction
    constexpr size_t MAX_HISTORY_COMMITS = 1000;  // also the clone depth
    constexpr size_t MAX_COMMIT_LOG = 10;         // default for `gitpulse log`

    // Diffing
    constexpr size_t BATCH_SIZE = 10;
    constexpr size_t FULL_DIFF_BUDGET = 30;
    constexpr size_t BINARY_SNIFF_BYTES = 8192;

    // Transport
    constexpr long CLONE_TIMEOUT_SECONDS = 120;
    constexpr long IDLE_TIMEOUT_SECONDS = 120;    // caller waits this long between progress messages

    // Worker channels
    constexpr size_t CHANNEL_CAPACITY = 64;

    // Statistics layer caps
    constexpr size_t FILE_CHURN_LIMIT = 100;
    constexpr size_t COUPLING_MIN_FILES = 2;
    constexpr size_t COUPLING_MAX_FILES = 50;
    constexpr size_t COUPLING_FILES_PER_COMMIT = 20;
    constexpr size_t COUPLING_MIN_COCHANGES = 3;
    constexpr size_t COUPLING_LIMIT = 20;
    constexpr size_t WORD_FREQUENCY_LIMIT = 80;
    constexpr size_t WORD_MIN_LENGTH = 3;
    constexpr size_t EXTENSION_LIMIT = 20;
    constexpr double BUS_FACTOR_THRESHOLD = 50.0;
}
}
