/**
 * @file advisor_session.cpp
 * @brief Routing of frames, responses and control events into the engine
 */

#include "engine/advisor_session.h"

#include <chrono>
#include <sstream>
#include <utility>

namespace hud_advisor::engine {

AdvisorSession::AdvisorSession(AdvisorConfig cfg, Clock clock)
    : m_cfg(cfg),
      m_clock(std::move(clock)),
      m_detector(cfg.detector),
      m_trigger(cfg.trigger),
      m_engine(cfg.engine) {
    m_stateSnapshot = m_engine.state();
    m_diagSnapshot = m_engine.diagnostics();
}

AdvisorSession::~AdvisorSession() {
    m_queue.stop();
}

double AdvisorSession::now() const {
    if (m_clock) return m_clock();
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void AdvisorSession::post(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(m_postMutex);
    const uint64_t gen = m_generation.load();
    m_queue.post([this, gen, handler = std::move(handler)]() {
        if (gen != m_generation.load()) {
            logDebug("session: dropped event of generation " + std::to_string(gen));
            return;
        }
        handler();
    });
}

void AdvisorSession::publish(const EngineUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        m_stateSnapshot = update.state;
        m_diagSnapshot = m_engine.diagnostics();
        m_pixelSnapshot = m_pixel;
    }
    if (update.emitted && m_onStateChange) {
        m_onStateChange(update.state);
    }
}

void AdvisorSession::addStats(double detectMs, double parseMs, double engineMs, bool frame) {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    m_stats.detectMs += detectMs;
    m_stats.parseMs += parseMs;
    m_stats.engineMs += engineMs;
    if (frame) ++m_stats.frames;
}

void AdvisorSession::applyPixelSignal(const PixelSignal& signal, double nowMs) {
    m_pixel = signal;
    const detect::ControlEvent ev = m_trigger.update(m_frameIdx++, nowMs, signal);

    std::ostringstream oss;
    oss << "session: pixel density=" << signal.density << " secondary=" << signal.secondaryDensity
        << " confidence=" << toString(signal.confidence);
    logDebug(oss.str());

    EngineUpdate update;
    update.outcome = Outcome::Ignored;
    if (ev.appeared) {
        m_engine.onControlAppeared();
        if (m_cfg.engine.readyOnControlWhileWaiting) {
            update = m_engine.onControlsDetectedWhileWaiting(nowMs);
        }
    }
    if (ev.disappeared) {
        update = m_engine.onControlDisappeared(nowMs);
    }
    update.state = m_engine.state();
    publish(update);
}

PixelSignal AdvisorSession::postFrame(const FrameView& frame) {
    double detectMs = 0.0;
    PixelSignal signal;
    {
        SCOPE_TIMER(detectMs);
        signal = m_detector.detect(frame);
    }
    addStats(detectMs, 0.0, 0.0, true);

    const double t = now();
    post([this, signal, t]() { applyPixelSignal(signal, t); });
    return signal;
}

void AdvisorSession::postPixelSignal(const PixelSignal& signal) {
    addStats(0.0, 0.0, 0.0, true);
    const double t = now();
    post([this, signal, t]() { applyPixelSignal(signal, t); });
}

void AdvisorSession::postResponse(const std::string& text) {
    double parseMs = 0.0;
    ClassifiedResponse response;
    {
        SCOPE_TIMER(parseMs);
        response = m_parser.parse(text);
    }
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        m_stats.parseMs += parseMs;
        ++m_stats.responses;
    }
    if (!response.fields.issue.empty()) {
        logWarning("session: consistency check: " + response.fields.issue);
    }

    const double t = now();
    post([this, response, t]() {
        double engineMs = 0.0;
        EngineUpdate update;
        {
            SCOPE_TIMER(engineMs);
            update = m_engine.onResponse(response, m_pixel, t);
        }
        addStats(0.0, 0.0, engineMs, false);
        publish(update);
    });
}

void AdvisorSession::postResponseStart() {
    post([this]() { m_engine.onResponseStarted(); });
}

void AdvisorSession::postStreamDelta(const std::string& prefix) {
    const double t = now();
    post([this, prefix, t]() {
        double engineMs = 0.0;
        EngineUpdate update;
        {
            SCOPE_TIMER(engineMs);
            update = m_engine.onStreamDelta(prefix, m_pixel, t);
        }
        addStats(0.0, 0.0, engineMs, false);
        publish(update);
    });
}

void AdvisorSession::postControlEvent(const detect::ControlEvent& event) {
    const double t = now();
    post([this, event, t]() {
        EngineUpdate update;
        update.outcome = Outcome::Ignored;
        if (event.appeared) {
            m_engine.onControlAppeared();
            if (m_cfg.engine.readyOnControlWhileWaiting) {
                update = m_engine.onControlsDetectedWhileWaiting(t);
            }
        }
        if (event.disappeared) {
            update = m_engine.onControlDisappeared(t);
        }
        update.state = m_engine.state();
        publish(update);
    });
}

void AdvisorSession::reset() {
    // Bump and enqueue as one step so the new generation queues behind the reset
    std::lock_guard<std::mutex> lock(m_postMutex);
    const uint64_t gen = m_generation.fetch_add(1) + 1;
    logInfo("session: reset, generation " + std::to_string(gen));
    m_queue.post([this]() {
        m_engine.reset();
        m_trigger.reset();
        m_pixel = PixelSignal{};
        m_frameIdx = 0;

        EngineUpdate update;
        update.emitted = true;
        update.outcome = Outcome::Committed;
        update.state = m_engine.state();
        publish(update);
    });
}

UiState AdvisorSession::state() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_stateSnapshot;
}

EngineDiagnostics AdvisorSession::diagnostics() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_diagSnapshot;
}

PixelSignal AdvisorSession::lastPixelSignal() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_pixelSnapshot;
}

PipelineStats AdvisorSession::stats() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_stats;
}

} // namespace hud_advisor::engine
