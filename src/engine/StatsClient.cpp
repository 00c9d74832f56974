#include "engine/StatsClient.hpp"

#include <optional>

#include "engine/StatsWorker.hpp"
#include "model/Json.hpp"
#include "util/Logger.hpp"

namespace gitpulse {

std::chrono::seconds StatsClient::waitWindow(const ProgressMessage* last, const EngineOptions& options) {
    bool cloning = !last || (last->step == Step::Cloning && last->percent < 40);
    return cloning ? options.cloneTimeout + options.idleTimeout : options.idleTimeout;
}

Expected<RawDataBundle> StatsClient::run(StartRequest request, const ProgressFn& onProgress) const {
    const EngineOptions options = request.options;
    StatsWorker worker;
    worker.start(std::move(request));

    std::optional<ProgressMessage> last;
    while (true) {
        const auto window = waitWindow(last ? &*last : nullptr, options);
        auto message = worker.outbox().popUntil(std::chrono::steady_clock::now() + window);
        if (!message) {
            worker.abandon();
            Logger::instance().warn("No progress for " + std::to_string(window.count()) + "s, abandoning the run");
            return Error{ErrorCode::Timeout,
                         "Analysis made no progress within " + std::to_string(window.count()) + "s"};
        }

        if (auto* progress = std::get_if<ProgressMessage>(&*message)) {
            if (onProgress) onProgress(*progress);
            last = *progress;
            continue;
        }

        worker.join();
        if (auto* result = std::get_if<ResultMessage>(&*message)) {
            return json::decodeRaw(result->payload);
        }
        const auto& error = std::get<ErrorMessage>(*message);
        return Error{error.code, error.message};
    }
}

}
