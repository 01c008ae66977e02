// WorkerPool.hpp
// Fixed set of threads draining a bounded task queue into a result channel.
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace Camscout {

// Results are handed back through nextResult() so that the owner applies them
// on its own thread. Tasks must not throw.
template <typename Result>
class WorkerPool {
public:
    using Task = std::function<Result()>;

    WorkerPool(size_t threads, size_t queueCapacity)
        : m_capacity(queueCapacity == 0 ? 1 : queueCapacity) {
        if (threads == 0) threads = 1;
        m_threads.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            m_threads.emplace_back(&WorkerPool::workerLoop, this);
        }
    }

    ~WorkerPool() {
        close();
        for (auto& t : m_threads) {
            if (t.joinable()) t.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Blocks while the queue is full. False once closed.
    bool submit(Task task) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_spaceCv.wait(lock, [this] { return m_closed || m_tasks.size() < m_capacity; });
        if (m_closed) return false;
        m_tasks.push_back(std::move(task));
        ++m_outstanding;
        m_taskCv.notify_one();
        return true;
    }

    bool trySubmit(Task task) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_tasks.size() >= m_capacity) return false;
        m_tasks.push_back(std::move(task));
        ++m_outstanding;
        m_taskCv.notify_one();
        return true;
    }

    // Next finished result, waiting up to waitMs. nullopt on timeout or when
    // nothing is outstanding.
    std::optional<Result> nextResult(int waitMs) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_resultCv.wait_for(lock, std::chrono::milliseconds(waitMs),
                            [this] { return !m_results.empty() || m_outstanding == 0; });
        if (m_results.empty()) return std::nullopt;
        Result r = std::move(m_results.front());
        m_results.pop_front();
        return r;
    }

    // Drops queued tasks that have not started. Returns how many were dropped.
    size_t discardPending() {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t dropped = m_tasks.size();
        m_tasks.clear();
        m_outstanding -= dropped;
        m_spaceCv.notify_all();
        m_resultCv.notify_all();
        return dropped;
    }

    // Queued plus running tasks, excluding results not yet collected.
    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_outstanding;
    }

    // Undelivered results plus outstanding tasks.
    size_t inFlight() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_outstanding + m_results.size();
    }

    // Workers finish what is queued, then exit.
    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_taskCv.notify_all();
        m_spaceCv.notify_all();
    }

    size_t threadCount() const { return m_threads.size(); }

private:
    void workerLoop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_taskCv.wait(lock, [this] { return m_closed || !m_tasks.empty(); });
                if (m_tasks.empty()) return; // closed and drained
                task = std::move(m_tasks.front());
                m_tasks.pop_front();
                m_spaceCv.notify_one();
            }
            Result r = task();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_results.push_back(std::move(r));
                --m_outstanding;
            }
            m_resultCv.notify_all();
        }
    }

    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_taskCv;
    std::condition_variable m_spaceCv;
    std::condition_variable m_resultCv;
    std::deque<Task> m_tasks;
    std::deque<Result> m_results;
    size_t m_outstanding{0};
    bool m_closed{false};
    std::vector<std::thread> m_threads;
};

} // namespace Camscout
