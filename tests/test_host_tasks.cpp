#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "sandbox/host_tasks.hpp"

using librarian::sandbox::HostCallResult;
using librarian::sandbox::HostCompletion;
using librarian::sandbox::HostTaskQueue;
using namespace std::chrono_literals;

namespace {

std::vector<HostCompletion> CollectAll(HostTaskQueue& queue, std::size_t expected) {
    std::vector<HostCompletion> all;
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (all.size() < expected && std::chrono::steady_clock::now() < deadline) {
        for (auto& completion : queue.WaitForCompletions(deadline)) {
            all.push_back(std::move(completion));
        }
    }
    return all;
}

}  // namespace

TEST_CASE("HostTaskQueue runs submitted work and reports completions", "[host_tasks]") {
    HostTaskQueue queue(2);
    const auto first = queue.Submit([] { return HostCallResult{true, "one", ""}; });
    const auto second = queue.Submit([] { return HostCallResult{true, 2, ""}; });
    CHECK(first != second);

    auto completions = CollectAll(queue, 2);
    REQUIRE(completions.size() == 2);
    std::sort(completions.begin(), completions.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    CHECK(completions[0].id == first);
    CHECK(completions[0].result.value == "one");
    CHECK(completions[1].result.value == 2);
    CHECK(queue.Outstanding() == 0);
}

TEST_CASE("HostTaskQueue turns exceptions into failed results", "[host_tasks]") {
    HostTaskQueue queue(1);
    queue.Submit([]() -> HostCallResult { throw std::runtime_error("provider down"); });

    const auto completions = CollectAll(queue, 1);
    REQUIRE(completions.size() == 1);
    CHECK_FALSE(completions[0].result.ok);
    CHECK(completions[0].result.error == "provider down");
}

TEST_CASE("HostTaskQueue runs calls concurrently up to its worker limit", "[host_tasks]") {
    HostTaskQueue queue(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 3; ++i) {
        queue.Submit([&] {
            const int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(100ms);
            --running;
            return HostCallResult{};
        });
    }
    CHECK(CollectAll(queue, 3).size() == 3);
    CHECK(peak.load() >= 2);
}

TEST_CASE("WaitForCompletions returns empty at the deadline", "[host_tasks]") {
    HostTaskQueue queue(1);
    auto release = std::make_shared<std::atomic<bool>>(false);
    queue.Submit([release] {
        while (!*release) {
            std::this_thread::sleep_for(5ms);
        }
        return HostCallResult{};
    });

    const auto start = std::chrono::steady_clock::now();
    CHECK(queue.WaitForCompletions(start + 50ms).empty());
    CHECK(queue.Outstanding() == 1);
    *release = true;
    CHECK(CollectAll(queue, 1).size() == 1);
}

TEST_CASE("Abandon does not wait for calls in flight", "[host_tasks]") {
    auto release = std::make_shared<std::atomic<bool>>(false);
    const auto start = std::chrono::steady_clock::now();
    {
        HostTaskQueue queue(1);
        queue.Submit([release] {
            while (!*release) {
                std::this_thread::sleep_for(5ms);
            }
            return HostCallResult{};
        });
        queue.Submit([] { return HostCallResult{}; });
        queue.Abandon();
        CHECK(queue.Outstanding() == 0);
        CHECK(queue.WaitForCompletions(std::chrono::steady_clock::now() + 1s).empty());
    }
    CHECK(std::chrono::steady_clock::now() - start < 500ms);
    *release = true;
}
