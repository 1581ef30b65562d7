#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// WorkerGroup — owns a batch of std::thread workers and joins every started
// one on destruction, so an exception between spawns (including a failed
// thread launch) unwinds without leaving a joinable thread behind.
// ---------------------------------------------------------------------------
class WorkerGroup {
public:
    explicit WorkerGroup(size_t expected = 0) { workers_.reserve(expected); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    ~WorkerGroup() { join(); }

    template <typename Fn>
    void spawn(Fn&& fn) {
        workers_.emplace_back(std::forward<Fn>(fn));
    }

    void join() {
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
};
