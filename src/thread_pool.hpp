#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <system_error>
#include <thread>
#include <vector>

// Fork-join worker group. run() starts n_threads workers, hands out task
// indices 0..n_tasks-1 in order, and joins every worker before returning.
// No state survives between calls. Tasks must not throw.
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
        : n_threads(std::max(1, n_threads))
    {}

    int thread_count() const { return n_threads; }

    void run(int n_tasks, const std::function<void(int)>& task)
    {
        if (n_tasks <= 0) return;

        std::atomic<int> next{0};
        auto worker_loop = [&] {
            while (true) {
                const int idx = next.fetch_add(1, std::memory_order_relaxed);
                if (idx >= n_tasks) return;
                task(idx);
            }
        };

        // The calling thread is worker 0.
        const int extra = std::min(n_threads, n_tasks) - 1;
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(extra));
        for (int i = 0; i < extra; ++i) {
            try {
                workers.emplace_back(worker_loop);
            } catch (const std::system_error&) {
                break;  // out of threads: the ones already running drain the queue
            }
        }
        worker_loop();
        for (auto& t : workers) t.join();
    }

    static int hardware_threads()
    {
        int n = static_cast<int>(std::thread::hardware_concurrency());
        return (n < 1) ? 4 : n;
    }

private:
    int n_threads;
};
