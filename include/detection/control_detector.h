#pragma once
/**
 * @file control_detector.h
 * @brief Pixel heuristic for the "your turn" action controls
 */

#include "types.h"

#include <cstdint>
#include <vector>

namespace hud_advisor::detect {

struct ControlDetectorConfig {
    // Lower band where the table client draws its action controls
    float bandTopFrac = 0.85f;

    // Horizontal sub-bands as fractions of the frame width
    float primaryXBeginFrac = 0.0f;
    float primaryXEndFrac = 0.7f;
    float secondaryXBeginFrac = 0.3f;
    float secondaryXEndFrac = 1.0f;

    int sampleStep = 8;

    // Primary (saturated red): r > primaryMinR, g < primaryMaxG, b < primaryMaxB
    int primaryMinR = 170;
    int primaryMaxG = 100;
    int primaryMaxB = 100;

    // Secondary (saturated blue): b > secondaryMinB, r < secondaryMaxR, b > g + secondaryBlueMargin
    int secondaryMinB = 150;
    int secondaryMaxR = 100;
    int secondaryBlueMargin = 40;

    float primaryDensityThreshold = 0.008f;
    float secondaryDensityThreshold = 0.01f;

    // Clustering grid over the primary sub-band; a 2x2 block of cells must
    // each exceed cellDensityThreshold
    int gridCols = 8;
    int gridRows = 4;
    float cellDensityThreshold = 0.004f;
};

/**
 * @brief Region sampled by the detector, in pixel coordinates
 */
struct ControlRegions {
    ROI primary;
    ROI secondary;
};

/**
 * @brief Detects the primary/secondary action controls in a BGRA frame
 *
 * A suit glyph on a card can pass the overall density gate on its own, so
 * the primary control additionally needs a spatially compact cluster: a 2x2
 * block of grid cells that are each dense enough.
 */
class ControlDetector {
public:
    ControlDetector() = default;
    explicit ControlDetector(ControlDetectorConfig cfg) : m_cfg(cfg) {}

    const ControlDetectorConfig& config() const { return m_cfg; }
    void setConfig(const ControlDetectorConfig& cfg) { m_cfg = cfg; }

    /**
     * @brief Classify one frame
     *
     * Degenerate input (null buffer, empty region, stride shorter than a
     * row) yields the default absent/Low signal.
     */
    PixelSignal detect(const FrameView& frame) const;

    /**
     * @brief Sub-band rectangles for a frame of the given size
     */
    ControlRegions regionsFor(int width, int height) const;

    bool isPrimaryColor(uint8_t r, uint8_t g, uint8_t b) const;
    bool isSecondaryColor(uint8_t r, uint8_t g, uint8_t b) const;

private:
    ControlDetectorConfig m_cfg;

    /// Primary density over roi; fills per-cell densities (row-major)
    float primaryDensity(const FrameView& frame, const ROI& roi, int step,
                         std::vector<float>& cellDensity, int cols, int rows) const;
    float secondaryDensity(const FrameView& frame, const ROI& roi, int step) const;
    static bool hasDenseBlock(const std::vector<float>& cellDensity, int cols, int rows, float threshold);
};

} // namespace hud_advisor::detect
