/**
 * @file timer.cpp
 * @brief Timer utility implementations
 *
 * Note: Most timer functionality is header-only in utils/timer.h
 * This file contains any additional utility functions.
 */

#include "utils/timer.h"
#include <iostream>
#include <iomanip>

namespace hud_advisor {

void printStats(const PipelineStats& stats) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "┌─────────────────────────────────────────┐\n";
    std::cout << "│ Advisor Timing                          │\n";
    std::cout << "├─────────────────────────────────────────┤\n";
    std::cout << "│ Frames:         " << std::setw(8) << stats.frames << "             │\n";
    std::cout << "│ Responses:      " << std::setw(8) << stats.responses << "             │\n";
    std::cout << "│ Detect:         " << std::setw(8) << stats.detectMs << " ms          │\n";
    std::cout << "│ Parse:          " << std::setw(8) << stats.parseMs << " ms          │\n";
    std::cout << "│ Engine:         " << std::setw(8) << stats.engineMs << " ms          │\n";
    std::cout << "├─────────────────────────────────────────┤\n";
    std::cout << "│ TOTAL:          " << std::setw(8) << stats.totalMs << " ms          │\n";
    std::cout << "└─────────────────────────────────────────┘\n";
}

} // namespace hud_advisor
