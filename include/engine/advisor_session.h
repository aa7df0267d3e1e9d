#pragma once
/**
 * @file advisor_session.h
 * @brief One advisor session: sensors, engine and the event queue that serializes them
 */

#include "types.h"
#include "detection/control_detector.h"
#include "detection/control_trigger.h"
#include "detection/field_parser.h"
#include "engine/event_queue.h"
#include "engine/reconciliation_engine.h"
#include "utils/logger.h"
#include "utils/timer.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace hud_advisor::engine {

/**
 * @brief Effective configuration of a session
 */
struct AdvisorConfig {
    detect::ControlDetectorConfig detector;
    detect::ControlTriggerConfig trigger;
    EngineConfig engine;
    LogLevel logLevel = LogLevel::INFO;
};

/**
 * @brief Owns the parser, detector, trigger and engine of one session
 *
 * Every post*() call is thread-safe. Sensors run on the posting thread;
 * only their results are queued, stamped with the clock and the session
 * generation at post time. reset() bumps the generation, so events posted
 * before it are dropped when they reach the front of the queue. The reset
 * itself always runs, and every event stamped with the new generation is
 * queued behind it.
 */
class AdvisorSession {
public:
    using Clock = std::function<double()>;                 ///< Milliseconds
    using StateCallback = std::function<void(const UiState&)>;

    explicit AdvisorSession(AdvisorConfig cfg = AdvisorConfig{}, Clock clock = Clock{});
    ~AdvisorSession();

    AdvisorSession(const AdvisorSession&) = delete;
    AdvisorSession& operator=(const AdvisorSession&) = delete;

    /// Called with a snapshot on every emitted state; set before start()
    void setOnStateChange(StateCallback cb) { m_onStateChange = std::move(cb); }

    /// Process events on a worker thread
    bool start() { return m_queue.start(); }
    void stop() { m_queue.stop(); }

    /// Process queued events on the calling thread (when not started)
    size_t drain() { return m_queue.drain(); }

    /**
     * @brief Run the control detector on a frame and queue its signal
     * @return The signal computed for this frame
     */
    PixelSignal postFrame(const FrameView& frame);

    void postPixelSignal(const PixelSignal& signal);

    /// Complete response text, parsed on the calling thread
    void postResponse(const std::string& text);

    /// A new response has started; call before its first delta
    void postResponseStart();

    /// Growing prefix of the in-flight response
    void postStreamDelta(const std::string& prefix);

    /// Control change reported by an external capture loop
    void postControlEvent(const detect::ControlEvent& event);

    /// Start a new session: discard queued events and clear all state
    void reset();

    UiState state() const;
    EngineDiagnostics diagnostics() const;
    PixelSignal lastPixelSignal() const;
    PipelineStats stats() const;
    uint64_t generation() const { return m_generation.load(); }

    const AdvisorConfig& config() const { return m_cfg; }

private:
    AdvisorConfig m_cfg;
    Clock m_clock;
    StateCallback m_onStateChange;

    detect::FieldParser m_parser;
    detect::ControlDetector m_detector;

    // Touched only by the consuming thread
    detect::ControlTrigger m_trigger;
    ReconciliationEngine m_engine;
    PixelSignal m_pixel;
    uint64_t m_frameIdx = 0;

    std::atomic<uint64_t> m_generation{0};
    std::mutex m_postMutex;     ///< Orders generation reads against reset()

    mutable std::mutex m_snapshotMutex;
    UiState m_stateSnapshot;
    EngineDiagnostics m_diagSnapshot;
    PixelSignal m_pixelSnapshot;
    PipelineStats m_stats;

    EventQueue m_queue;

    double now() const;
    void post(std::function<void()> handler);
    void publish(const EngineUpdate& update);
    void addStats(double detectMs, double parseMs, double engineMs, bool frame);
    void applyPixelSignal(const PixelSignal& signal, double nowMs);
};

} // namespace hud_advisor::engine
