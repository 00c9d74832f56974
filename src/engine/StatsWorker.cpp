#include "engine/StatsWorker.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include "core/Repository.hpp"
#include "engine/CloneTransport.hpp"
#include "engine/HistoryPipeline.hpp"
#include "model/Json.hpp"
#include "util/Logger.hpp"

namespace gitpulse {

namespace {
    // Unwinds a session whose outbox was closed by the caller
    class RunAbandoned : public std::runtime_error {
    public:
        RunAbandoned() : std::runtime_error("Run abandoned by the caller") {}
    };

    class AbandonedThreads {
    public:
        static AbandonedThreads& instance() {
            static AbandonedThreads registry;
            return registry;
        }

        // Parked threads log; the logger is constructed first so it is destroyed last
        AbandonedThreads() { Logger::instance(); }
        ~AbandonedThreads() { joinAll(); }

        void park(std::thread thread) {
            std::lock_guard<std::mutex> lock(mutex);
            threads.push_back(std::move(thread));
        }

        void joinAll() {
            std::vector<std::thread> pending;
            {
                std::lock_guard<std::mutex> lock(mutex);
                pending.swap(threads);
            }
            for (auto& thread : pending) {
                if (thread.joinable()) thread.join();
            }
        }

    private:
        std::mutex mutex;
        std::vector<std::thread> threads;
    };

    Expected<std::string> runSession(const StartRequest& request, Channel<WorkerMessage>& outbox) {
        auto post = [&outbox](Step step, int percent, const std::string& message) {
            if (!outbox.push(ProgressMessage{step, percent, message})) {
                throw RunAbandoned();
            }
        };

        auto valid = ICloneTransport::validateName(request.owner, request.repo);
        if (!valid) return valid.error();

        post(Step::Cloning, 0, "Cloning repository...");
        auto scratch = ScratchDirectory::create(request.options.scratchRoot);
        if (!scratch) return scratch.error();

        auto transport = ICloneTransport::create(request.options, request.proxyUrl);
        Logger::instance().debug("Fetching " + request.owner + "/" + request.repo + " via " + transport->describe());
        std::filesystem::path destination = scratch.value()->path() / "repo.git";
        auto fetched = transport->fetch(request.owner, request.repo, destination);
        if (!fetched) return fetched.error();
        post(Step::Cloning, 40, "Clone complete");

        auto repo = Repository::open(destination);
        if (!repo) return repo.error();

        HistoryPipeline pipeline(*repo.value(), request.options);
        auto raw = pipeline.run(post);
        if (!raw) return raw.error();

        // Serialize before the scratch directory goes away
        return json::encodeRaw(raw.value());
    }
}

StatsWorker::StatsWorker()
    : in(std::make_shared<Channel<StartRequest>>(1)), out(std::make_shared<Channel<WorkerMessage>>()) {}

StatsWorker::~StatsWorker() {
    if (thread.joinable()) {
        thread.join();
    }
}

void StatsWorker::start(StartRequest request) {
    if (thread.joinable()) {
        throw std::logic_error("StatsWorker already started");
    }
    in->push(std::move(request));
    in->close();
    auto inbox = in;
    auto outbox = out;
    thread = std::thread([inbox, outbox]() { serve(*inbox, *outbox); });
}

void StatsWorker::abandon() {
    out->close();
    if (thread.joinable()) {
        AbandonedThreads::instance().park(std::move(thread));
    }
}

void StatsWorker::reapAbandoned() {
    AbandonedThreads::instance().joinAll();
}

void StatsWorker::join() {
    if (thread.joinable()) {
        thread.join();
    }
}

void StatsWorker::serve(Channel<StartRequest>& inbox, Channel<WorkerMessage>& outbox) {
    auto request = inbox.pop();
    if (!request) {
        outbox.push(ErrorMessage{ErrorCode::InvalidArgs, "No start request"});
        return;
    }

    Expected<std::string> result = Error{ErrorCode::InternalError, "Clone failed"};
    try {
        result = runSession(*request, outbox);
    } catch (const RunAbandoned&) {
        Logger::instance().debug("Worker stopped after its run was abandoned");
        return;
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (result) {
        outbox.push(ResultMessage{std::move(result.value())});
    } else {
        Logger::instance().debug(std::string("Worker failed: ") + result.error().message);
        outbox.push(ErrorMessage{result.error().code, result.error().message});
    }
}

}
