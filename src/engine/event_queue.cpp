/**
 * @file event_queue.cpp
 * @brief Single-consumer FIFO of closures
 */

#include "engine/event_queue.h"
#include "utils/logger.h"

#include <exception>
#include <utility>

namespace hud_advisor::engine {

EventQueue::~EventQueue() {
    stop();
}

void EventQueue::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
}

bool EventQueue::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return false;
    m_running = true;
    m_stopRequested = false;
    m_worker = std::thread([this]() { runWorker(); });
    return true;
}

void EventQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_running = false;
    m_stopRequested = false;
}

void EventQueue::runTask(Task& task) {
    std::lock_guard<std::mutex> consumer(m_consumerMutex);
    try {
        task();
    } catch (const std::exception& e) {
        logError(std::string("EventQueue: task failed: ") + e.what());
    }
}

void EventQueue::runWorker() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]() { return m_stopRequested || !m_queue.empty(); });
            if (m_stopRequested && m_queue.empty()) break;
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        runTask(task);
    }
}

size_t EventQueue::drain() {
    size_t count = 0;
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_running) {
                if (count == 0) logWarning("EventQueue: drain() ignored while the worker is running");
                return count;
            }
            if (m_queue.empty()) return count;
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        runTask(task);
        ++count;
    }
}

size_t EventQueue::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool EventQueue::running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

} // namespace hud_advisor::engine
