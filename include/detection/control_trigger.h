#pragma once

#include "types.h"

#include <cstdint>

namespace hud_advisor::detect {

struct ControlTriggerConfig {
    int appearConfirmFrames = 1;
    int disappearConfirmFrames = 1;
};

/**
 * @brief Change of the primary control between frames
 */
struct ControlEvent {
    bool appeared = false;
    bool disappeared = false;
    bool present = false;           ///< Debounced state after this frame
    uint64_t frameIdx = 0;          ///< First frame of the new state
    double frameTimeMs = 0.0;
};

struct ControlTriggerState {
    bool present = false;
    int presentCount = 0;
    int absentCount = 0;
    uint64_t firstChangeFrame = 0;
    double firstChangeTimeMs = 0.0;
};

/**
 * @brief Debounces primaryControlPresent into appeared/disappeared events
 */
class ControlTrigger {
public:
    ControlTrigger() = default;
    explicit ControlTrigger(ControlTriggerConfig cfg) : m_cfg(cfg) {}
    void reset() { m_state = ControlTriggerState{}; }
    const ControlTriggerState& state() const { return m_state; }
    const ControlTriggerConfig& config() const { return m_cfg; }

    ControlEvent update(uint64_t frameIdx, double frameTimeMs, const PixelSignal& signal);

private:
    ControlTriggerConfig m_cfg;
    ControlTriggerState m_state;
};

} // namespace hud_advisor::detect
