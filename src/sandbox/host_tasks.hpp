#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace librarian::sandbox {

struct HostCallResult {
    bool ok = true;
    nlohmann::json value;
    std::string error;
};

struct HostCompletion {
    std::uint64_t id = 0;
    HostCallResult result;
};

// Runs blocking host calls (file tools, llm_query) off the script thread.
// Workers are detached and share state with the queue through a shared_ptr,
// so abandoning the queue never waits for a call still in flight.
class HostTaskQueue {
public:
    using Work = std::function<HostCallResult()>;

    explicit HostTaskQueue(std::size_t max_workers);
    ~HostTaskQueue();

    HostTaskQueue(const HostTaskQueue&) = delete;
    HostTaskQueue& operator=(const HostTaskQueue&) = delete;

    std::uint64_t Submit(Work work);

    // Blocks until at least one call completes or the deadline passes.
    std::vector<HostCompletion> WaitForCompletions(std::chrono::steady_clock::time_point deadline);

    // Submitted calls whose completion has not been collected yet.
    std::size_t Outstanding() const;

    // Drops queued calls and discards late completions. Does not block.
    void Abandon();

private:
    struct State;
    static void WorkerLoop(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

}  // namespace librarian::sandbox
