#pragma once

#include <chrono>
#include <functional>

#include "engine/Messages.hpp"
#include "model/GitStats.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

/**
 * @brief Caller side of the worker boundary
 *
 * Starts a StatsWorker, forwards its progress, and decodes the terminal
 * message. The wait restarts with every progress message: idleTimeout
 * normally, cloneTimeout + idleTimeout while the clone is running. When a
 * window passes in silence the worker is abandoned and the run fails with
 * ErrorCode::Timeout.
 */
class StatsClient {
public:
    using ProgressFn = std::function<void(const ProgressMessage&)>;

    Expected<RawDataBundle> run(StartRequest request, const ProgressFn& onProgress = nullptr) const;

    /// How long to wait for the next message after @p last (nullptr: nothing received yet)
    static std::chrono::seconds waitWindow(const ProgressMessage* last, const EngineOptions& options);
};

}
