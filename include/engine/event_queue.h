#pragma once
/**
 * @file event_queue.h
 * @brief Single-consumer FIFO of closures
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace hud_advisor::engine {

/**
 * @brief Serializes events for one consumer
 *
 * Producers may post from any thread. Tasks are consumed either by the
 * queue's own worker thread (start()/stop()) or by the caller through
 * drain(), never both: drain() does nothing while the worker runs. Each task
 * runs to completion before the next one starts. drain() is meant for a
 * single consuming thread.
 */
class EventQueue {
public:
    using Task = std::function<void()>;

    EventQueue() = default;
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void post(Task task);

    /**
     * @brief Start the worker thread
     * @return false if it is already running
     */
    bool start();

    /**
     * @brief Run what is still queued, then join the worker
     */
    void stop();

    /**
     * @brief Run every queued task on the calling thread
     * @return Number of tasks run (0 while the worker is running)
     */
    size_t drain();

    size_t pending() const;
    bool running() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_queue;
    std::thread m_worker;
    bool m_running = false;
    bool m_stopRequested = false;

    // Held while a task executes, so tasks never overlap
    std::mutex m_consumerMutex;

    void runWorker();
    void runTask(Task& task);
};

} // namespace hud_advisor::engine
