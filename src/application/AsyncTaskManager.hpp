/**
 * @file AsyncTaskManager.hpp
 * @brief Fixed-size worker pool with a bounded submission queue.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace streamsieve::application {

/**
 * @class AsyncTaskManager
 * @brief Runs submitted tasks on a fixed number of threads.
 *
 * At most @c workerCount tasks execute at once and at most @c queueCapacity wait;
 * SubmitTask() blocks while the queue is full. Each submission returns a future that
 * carries the task's result or the exception it threw.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager(std::size_t workerCount, std::size_t queueCapacity)
        : m_queueCapacity(std::max<std::size_t>(queueCapacity, 1)) {
        std::size_t count = std::max<std::size_t>(workerCount, 1);
        m_workers.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            m_workers.emplace_back(&AsyncTaskManager::WorkerLoop, this);
        }
    }

    ~AsyncTaskManager() {
        Shutdown();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Queues @p f for execution, blocking while the queue is full.
     * @throws std::runtime_error if the manager is shutting down.
     */
    template<typename F>
    std::future<std::invoke_result_t<std::decay_t<F>>> SubmitTask(F&& f) {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notFull.wait(lock, [this] {
                return m_queue.size() < m_queueCapacity || m_stopping;
            });
            if (m_stopping) {
                throw std::runtime_error("AsyncTaskManager is shutting down");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_notEmpty.notify_one();
        return future;
    }

    /** @brief Blocks until nothing is queued or running. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] {
            return m_queue.empty() && m_running == 0;
        });
    }

    /** @brief Runs what is already queued, then stops and joins the workers. */
    void Shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) return;
            m_stopping = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    std::size_t GetWorkerCount() const { return m_workers.size(); }
    std::size_t GetQueueCapacity() const { return m_queueCapacity; }

private:
    void WorkerLoop() {
        while (true) {
            std::function<void()> job;

            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_notEmpty.wait(lock, [this] {
                    return !m_queue.empty() || m_stopping;
                });

                if (m_stopping && m_queue.empty()) {
                    return; // Exit point
                }

                job = std::move(m_queue.front());
                m_queue.pop();
                ++m_running;
            }
            m_notFull.notify_one();

            // packaged_task stores any exception in the future
            job();

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_running;
                if (m_queue.empty() && m_running == 0) {
                    m_idle.notify_all();
                }
            }
        }
    }

    std::size_t m_queueCapacity;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_queue;
    std::size_t m_running = 0;
    bool m_stopping = false;

    std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::condition_variable m_idle;
};

} // namespace streamsieve::application
