#include "sandbox/host_tasks.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>

namespace librarian::sandbox {

struct HostTaskQueue::State {
    mutable std::mutex mutex;
    std::condition_variable work_cv;
    std::condition_variable done_cv;
    std::deque<std::pair<std::uint64_t, Work>> pending;
    std::vector<HostCompletion> completed;
    std::size_t max_workers = 1;
    std::size_t workers = 0;
    std::size_t idle_workers = 0;
    std::size_t outstanding = 0;
    std::uint64_t next_id = 1;
    bool abandoned = false;
};

HostTaskQueue::HostTaskQueue(std::size_t max_workers)
    : state_(std::make_shared<State>()) {
    state_->max_workers = max_workers == 0 ? 1 : max_workers;
}

HostTaskQueue::~HostTaskQueue() {
    Abandon();
}

std::uint64_t HostTaskQueue::Submit(Work work) {
    bool spawn = false;
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        id = state_->next_id++;
        state_->pending.emplace_back(id, std::move(work));
        ++state_->outstanding;
        if (state_->pending.size() > state_->idle_workers && state_->workers < state_->max_workers) {
            ++state_->workers;
            spawn = true;
        }
    }
    if (spawn) {
        try {
            std::thread(&HostTaskQueue::WorkerLoop, state_).detach();
        } catch (const std::system_error& ex) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            --state_->workers;
            if (state_->workers == 0 && !state_->pending.empty()) {
                // No worker will ever pick these up; fail them now.
                for (auto& [pending_id, _] : state_->pending) {
                    state_->completed.push_back(HostCompletion{
                        pending_id, HostCallResult{false, nullptr, std::string("failed to start host worker: ") + ex.what()}});
                }
                state_->pending.clear();
                state_->done_cv.notify_all();
            }
        }
    } else {
        state_->work_cv.notify_one();
    }
    return id;
}

void HostTaskQueue::WorkerLoop(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        ++state->idle_workers;
        state->work_cv.wait(lock, [&state] { return state->abandoned || !state->pending.empty(); });
        --state->idle_workers;
        if (state->abandoned) {
            break;
        }
        auto [id, work] = std::move(state->pending.front());
        state->pending.pop_front();
        lock.unlock();

        HostCallResult result{};
        try {
            result = work();
        } catch (const std::exception& ex) {
            result.ok = false;
            result.error = ex.what();
        }

        lock.lock();
        if (state->abandoned) {
            break;
        }
        state->completed.push_back(HostCompletion{id, std::move(result)});
        state->done_cv.notify_all();
    }
    --state->workers;
}

std::vector<HostCompletion> HostTaskQueue::WaitForCompletions(
    std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->done_cv.wait_until(lock, deadline, [this] {
        return state_->abandoned || !state_->completed.empty();
    });
    std::vector<HostCompletion> completions;
    completions.swap(state_->completed);
    state_->outstanding -= completions.size();
    return completions;
}

std::size_t HostTaskQueue::Outstanding() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->outstanding;
}

void HostTaskQueue::Abandon() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->abandoned) {
            return;
        }
        state_->abandoned = true;
        state_->pending.clear();
        state_->completed.clear();
        state_->outstanding = 0;
    }
    state_->work_cv.notify_all();
    state_->done_cv.notify_all();
}

}  // namespace librarian::sandbox
