#pragma once
/**
 * @file timer.h
 * @brief High-resolution timing utilities for performance measurement
 */

#include <chrono>
#include <cstdint>

namespace hud_advisor {

/**
 * @brief High-resolution CPU timer using steady_clock
 */
class HighResTimer {
public:
    using Clock = std::chrono::steady_clock;

    void start() {
        m_start = Clock::now();
    }

    void stop() {
        m_stop = Clock::now();
    }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(m_stop - m_start).count();
    }

    double elapsedUs() const {
        return std::chrono::duration<double, std::micro>(m_stop - m_start).count();
    }

    double currentElapsedMs() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - m_start).count();
    }

private:
    Clock::time_point m_start{};
    Clock::time_point m_stop{};
};

/**
 * @brief RAII timer for automatic scope timing
 */
class ScopedTimer {
public:
    explicit ScopedTimer(double& output) : m_output(output) {
        m_timer.start();
    }

    ~ScopedTimer() {
        m_timer.stop();
        m_output = m_timer.elapsedMs();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    HighResTimer m_timer;
    double& m_output;
};

#define SCOPE_TIMER_CAT2(a, b) a##b
#define SCOPE_TIMER_CAT(a, b) SCOPE_TIMER_CAT2(a, b)

/**
 * @brief Macro for easy scope timing
 */
#define SCOPE_TIMER(var) ::hud_advisor::ScopedTimer SCOPE_TIMER_CAT(_scopedTimer, __LINE__)(var)

/**
 * @brief Per-stage timing of one replay, accumulated over all events
 */
struct PipelineStats {
    double detectMs = 0.0;      ///< Control detector
    double parseMs = 0.0;       ///< Field parser
    double engineMs = 0.0;      ///< Reconciliation engine
    double totalMs = 0.0;       ///< Wall time of the whole run
    uint64_t frames = 0;        ///< Frames / pixel signals processed
    uint64_t responses = 0;     ///< Full responses and stream deltas processed
};

/**
 * @brief Print pipeline stats in formatted table
 */
void printStats(const PipelineStats& stats);

} // namespace hud_advisor
