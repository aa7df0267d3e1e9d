/**
 * @file control_detector.cpp
 * @brief Region/cluster based detection of the action controls
 */

#include "detection/control_detector.h"

#include <algorithm>
#include <cmath>

namespace hud_advisor::detect {

namespace {

int clampInt(int v, int lo, int hi) {
    return (std::max)(lo, (std::min)(v, hi));
}

ROI bandRegion(const char* name, int width, int height, float bandTopFrac, float xBeginFrac, float xEndFrac) {
    ROI roi;
    roi.name = name;
    const int top = clampInt(static_cast<int>(std::floor(height * bandTopFrac)), 0, height);
    const int x0 = clampInt(static_cast<int>(std::floor(width * xBeginFrac)), 0, width);
    const int x1 = clampInt(static_cast<int>(std::floor(width * xEndFrac)), 0, width);
    roi.x = x0;
    roi.y = top;
    roi.w = (std::max)(0, x1 - x0);
    roi.h = height - top;
    return roi;
}

} // namespace

bool ControlDetector::isPrimaryColor(uint8_t r, uint8_t g, uint8_t b) const {
    return r > m_cfg.primaryMinR && g < m_cfg.primaryMaxG && b < m_cfg.primaryMaxB;
}

bool ControlDetector::isSecondaryColor(uint8_t r, uint8_t g, uint8_t b) const {
    return b > m_cfg.secondaryMinB && r < m_cfg.secondaryMaxR && b > g + m_cfg.secondaryBlueMargin;
}

ControlRegions ControlDetector::regionsFor(int width, int height) const {
    ControlRegions regions;
    if (width <= 0 || height <= 0) return regions;
    regions.primary = bandRegion("primary_band", width, height, m_cfg.bandTopFrac,
                                 m_cfg.primaryXBeginFrac, m_cfg.primaryXEndFrac);
    regions.secondary = bandRegion("secondary_band", width, height, m_cfg.bandTopFrac,
                                   m_cfg.secondaryXBeginFrac, m_cfg.secondaryXEndFrac);
    return regions;
}

float ControlDetector::primaryDensity(const FrameView& frame, const ROI& roi, int step,
                                      std::vector<float>& cellDensity, int cols, int rows) const {
    std::vector<int> cellHits(static_cast<size_t>(cols) * rows, 0);
    std::vector<int> cellSamples(static_cast<size_t>(cols) * rows, 0);
    int hits = 0;
    int samples = 0;

    for (int y = roi.y; y < roi.y + roi.h; y += step) {
        const uint8_t* row = frame.bgra + static_cast<size_t>(y) * static_cast<size_t>(frame.strideBytes);
        const int cy = (std::min)(rows - 1, (y - roi.y) * rows / roi.h);
        for (int x = roi.x; x < roi.x + roi.w; x += step) {
            const uint8_t* px = row + static_cast<size_t>(x) * 4;
            const int cx = (std::min)(cols - 1, (x - roi.x) * cols / roi.w);
            const size_t cell = static_cast<size_t>(cy) * cols + cx;
            ++samples;
            ++cellSamples[cell];
            if (isPrimaryColor(px[2], px[1], px[0])) {
                ++hits;
                ++cellHits[cell];
            }
        }
    }

    cellDensity.assign(cellHits.size(), 0.0f);
    for (size_t i = 0; i < cellHits.size(); ++i) {
        if (cellSamples[i] > 0) {
            cellDensity[i] = static_cast<float>(cellHits[i]) / static_cast<float>(cellSamples[i]);
        }
    }
    return samples > 0 ? static_cast<float>(hits) / static_cast<float>(samples) : 0.0f;
}

float ControlDetector::secondaryDensity(const FrameView& frame, const ROI& roi, int step) const {
    int hits = 0;
    int samples = 0;
    for (int y = roi.y; y < roi.y + roi.h; y += step) {
        const uint8_t* row = frame.bgra + static_cast<size_t>(y) * static_cast<size_t>(frame.strideBytes);
        for (int x = roi.x; x < roi.x + roi.w; x += step) {
            const uint8_t* px = row + static_cast<size_t>(x) * 4;
            ++samples;
            if (isSecondaryColor(px[2], px[1], px[0])) ++hits;
        }
    }
    return samples > 0 ? static_cast<float>(hits) / static_cast<float>(samples) : 0.0f;
}

bool ControlDetector::hasDenseBlock(const std::vector<float>& cellDensity, int cols, int rows, float threshold) {
    auto dense = [&](int cx, int cy) {
        return cellDensity[static_cast<size_t>(cy) * cols + cx] > threshold;
    };
    for (int cy = 0; cy + 1 < rows; ++cy) {
        for (int cx = 0; cx + 1 < cols; ++cx) {
            if (dense(cx, cy) && dense(cx + 1, cy) && dense(cx, cy + 1) && dense(cx + 1, cy + 1)) {
                return true;
            }
        }
    }
    return false;
}

PixelSignal ControlDetector::detect(const FrameView& frame) const {
    PixelSignal signal;
    if (!frame.bgra || frame.width <= 0 || frame.height <= 0) return signal;
    if (frame.strideBytes < frame.width * 4) return signal;

    const int step = (std::max)(1, m_cfg.sampleStep);
    const int cols = (std::max)(2, m_cfg.gridCols);
    const int rows = (std::max)(2, m_cfg.gridRows);
    const ControlRegions regions = regionsFor(frame.width, frame.height);

    if (!regions.primary.empty()) {
        std::vector<float> cells;
        signal.density = primaryDensity(frame, regions.primary, step, cells, cols, rows);
        signal.primaryControlPresent = signal.density > m_cfg.primaryDensityThreshold &&
                                       hasDenseBlock(cells, cols, rows, m_cfg.cellDensityThreshold);
    }
    if (!regions.secondary.empty()) {
        signal.secondaryDensity = secondaryDensity(frame, regions.secondary, step);
        signal.secondaryControlPresent = signal.secondaryDensity > m_cfg.secondaryDensityThreshold;
    }

    signal.confidence = confidenceFor(signal.primaryControlPresent, signal.secondaryControlPresent);
    return signal;
}

} // namespace hud_advisor::detect
