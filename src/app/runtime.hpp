#pragma once
// Purpose: Runtime services (task scheduling). Lightweight header-only implementation.
// Notes:
// - run_all() is a fixed-size pool: workers pull task indices from an atomic counter.
// - Tasks must not throw; results are reported through state owned by the caller.

#include <functional>
#include <thread>
#include <atomic>
#include <vector>
#include <cstddef>
#include <algorithm>

namespace app {
namespace runtime {

using Task = std::function<void()>;

namespace detail {

// Joins every joinable thread in `threads` on scope exit, including during unwinding.
class JoinGuard {
public:
    explicit JoinGuard(std::vector<std::thread>& threads) : threads_(threads) {}
    ~JoinGuard() {
        for (auto& th : threads_) {
            if (th.joinable()) th.join();
        }
    }
    JoinGuard(const JoinGuard&) = delete;
    JoinGuard& operator=(const JoinGuard&) = delete;

private:
    std::vector<std::thread>& threads_;
};

} // namespace detail

// Runs every task once on at most `workers` threads and returns when all are done.
// workers <= 1 runs the tasks inline, in order.
// If a thread cannot be started, the ones already running finish the queue and
// the std::system_error propagates.
inline void run_all(const std::vector<Task>& tasks, std::size_t workers) {
    if (tasks.empty()) return;
    if (workers <= 1 || tasks.size() == 1) {
        for (const auto& t : tasks) t();
        return;
    }

    std::atomic<std::size_t> next{0};
    auto worker = [&tasks, &next]() {
        for (std::size_t i = next.fetch_add(1); i < tasks.size(); i = next.fetch_add(1)) {
            tasks[i]();
        }
    };

    std::vector<std::thread> pool;
    detail::JoinGuard join_all(pool);
    std::size_t n = std::min(workers, tasks.size());
    pool.reserve(n);
    for (std::size_t i = 0; i < n; ++i) pool.emplace_back(worker);
}

} // namespace runtime
} // namespace app
