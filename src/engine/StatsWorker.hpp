#pragma once

#include <memory>
#include <thread>

#include "engine/Channel.hpp"
#include "engine/Messages.hpp"

namespace gitpulse {

/**
 * @brief Isolated context that runs one clone-and-diff session
 *
 * The worker thread takes a single StartRequest from its inbox, clones into
 * a private scratch directory, runs the HistoryPipeline and posts progress
 * followed by exactly one ResultMessage or ErrorMessage to its outbox.
 * The repository and its object store never leave the thread; the result
 * crosses as JSON.
 *
 * Both channels are shared with the thread, so an abandoned worker can keep
 * running after its owner is gone. Closing the outbox makes the session stop
 * at its next progress point; the thread is parked until reapAbandoned().
 */
class StatsWorker {
public:
    StatsWorker();
    ~StatsWorker();

    StatsWorker(const StatsWorker&) = delete;
    StatsWorker& operator=(const StatsWorker&) = delete;

    /// Post the request and start the thread (once per worker)
    void start(StartRequest request);

    Channel<WorkerMessage>& outbox() { return *out; }

    /// Abandon the run: discard further messages and park the thread for reaping
    void abandon();

    /// Join every abandoned thread; their scratch directories are gone afterwards
    static void reapAbandoned();

    /// Wait for the thread to finish
    void join();

    /// The session body, run on the worker thread
    static void serve(Channel<StartRequest>& inbox, Channel<WorkerMessage>& outbox);

private:
    std::shared_ptr<Channel<StartRequest>> in;
    std::shared_ptr<Channel<WorkerMessage>> out;
    std::thread thread;
};

}
