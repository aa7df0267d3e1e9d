#include "detection/control_trigger.h"

#include <algorithm>

namespace hud_advisor::detect {

ControlEvent ControlTrigger::update(uint64_t frameIdx, double frameTimeMs, const PixelSignal& signal) {
    ControlEvent ev{};

    auto markChange = [&](int count) {
        if (count == 1) {
            m_state.firstChangeFrame = frameIdx;
            m_state.firstChangeTimeMs = frameTimeMs;
        }
    };

    if (signal.primaryControlPresent) {
        m_state.absentCount = 0;
        if (!m_state.present) {
            markChange(++m_state.presentCount);
            if (m_state.presentCount >= (std::max)(1, m_cfg.appearConfirmFrames)) {
                m_state.present = true;
                m_state.presentCount = 0;
                ev.appeared = true;
            }
        }
    } else {
        m_state.presentCount = 0;
        if (m_state.present) {
            markChange(++m_state.absentCount);
            if (m_state.absentCount >= (std::max)(1, m_cfg.disappearConfirmFrames)) {
                m_state.present = false;
                m_state.absentCount = 0;
                ev.disappeared = true;
            }
        }
    }

    ev.present = m_state.present;
    if (ev.appeared || ev.disappeared) {
        ev.frameIdx = m_state.firstChangeFrame;
        ev.frameTimeMs = m_state.firstChangeTimeMs;
    }
    return ev;
}

} // namespace hud_advisor::detect
