#pragma once
/**
 * @file test_helpers.h
 * @brief Shared builders for frames, responses and pixel signals
 */

#include "types.h"

#include <algorithm>
#include <cstdint>
#include <string>

namespace hud_advisor::test {

/**
 * @brief Owned BGRA frame filled with one opaque colour
 * @param padBytes Extra bytes at the end of every row
 */
inline Frame makeFrame(int width, int height, int padBytes = 0,
                       uint8_t r = 40, uint8_t g = 90, uint8_t b = 40) {
    Frame frame;
    frame.width = width;
    frame.height = height;
    frame.strideBytes = width * 4 + padBytes;
    frame.bgra.assign(static_cast<size_t>(frame.strideBytes) * height, 0);
    for (int y = 0; y < height; ++y) {
        uint8_t* row = frame.bgra.data() + static_cast<size_t>(y) * frame.strideBytes;
        for (int x = 0; x < width; ++x) {
            row[x * 4 + 0] = b;
            row[x * 4 + 1] = g;
            row[x * 4 + 2] = r;
            row[x * 4 + 3] = 255;
        }
    }
    return frame;
}

/**
 * @brief Paint a rectangle, clipped to the frame
 */
inline void fillRect(Frame& frame, int x, int y, int w, int h, uint8_t r, uint8_t g, uint8_t b) {
    const int x0 = (std::max)(0, x);
    const int y0 = (std::max)(0, y);
    const int x1 = (std::min)(frame.width, x + w);
    const int y1 = (std::min)(frame.height, y + h);
    for (int yy = y0; yy < y1; ++yy) {
        uint8_t* row = frame.bgra.data() + static_cast<size_t>(yy) * frame.strideBytes;
        for (int xx = x0; xx < x1; ++xx) {
            row[xx * 4 + 0] = b;
            row[xx * 4 + 1] = g;
            row[xx * 4 + 2] = r;
        }
    }
}

/// Saturated red, the colour of the primary control
inline void paintPrimary(Frame& frame, int x, int y, int w, int h) {
    fillRect(frame, x, y, w, h, 210, 30, 30);
}

/// Saturated blue, the colour of the secondary control
inline void paintSecondary(Frame& frame, int x, int y, int w, int h) {
    fillRect(frame, x, y, w, h, 30, 60, 220);
}

inline ClassifiedResponse response(ActionKind kind, const std::string& display,
                                   const std::string& hand = "") {
    ClassifiedResponse r;
    r.actionKind = kind;
    r.displayText = display;
    r.fields.hand = hand;
    return r;
}

inline PixelSignal pixel(bool primary, Confidence confidence) {
    PixelSignal p;
    p.primaryControlPresent = primary;
    p.secondaryControlPresent = confidence == Confidence::High;
    p.confidence = confidence;
    return p;
}

inline PixelSignal noControl() {
    return pixel(false, Confidence::Low);
}

inline PixelSignal controlVisible() {
    return pixel(true, Confidence::High);
}

} // namespace hud_advisor::test
