#pragma once

#include <string>
#include <variant>

#include "engine/EngineOptions.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

/// Inbound: the one request that starts a run
struct StartRequest {
    std::string owner;
    std::string repo;
    std::string proxyUrl;    // empty: direct connection
    EngineOptions options;
};

enum class Step { Cloning, ExtractingCommits, ExtractingDetails, ComputingStats };

inline const char* stepName(Step step) {
    switch (step) {
        case Step::Cloning: return "cloning";
        case Step::ExtractingCommits: return "extracting-commits";
        case Step::ExtractingDetails: return "extracting-details";
        case Step::ComputingStats: return "computing-stats";
    }
    return "unknown";
}

struct ProgressMessage {
    Step step{Step::Cloning};
    int percent{0};
    std::string message;
};

/// Terminal success: the RawDataBundle serialized as JSON
struct ResultMessage {
    std::string payload;
};

/// Terminal failure, no partial data
struct ErrorMessage {
    ErrorCode code{ErrorCode::InternalError};
    std::string message;
};

using WorkerMessage = std::variant<ProgressMessage, ResultMessage, ErrorMessage>;

}
