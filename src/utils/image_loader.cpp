/**
 * @file image_loader.cpp
 * @brief Static image loading implementation using OpenCV
 */

#include "utils/image_loader.h"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cstring>

namespace hud_advisor {

bool loadFrameBGRA(const std::string& path, Frame& frame, std::string& errorMessage) {
    errorMessage.clear();

    cv::Mat src;
    try {
        src = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        errorMessage = std::string("Error reading image: ") + e.what();
        return false;
    }
    if (src.empty()) {
        errorMessage = "Cannot read image: " + path;
        return false;
    }
    if (src.depth() != CV_8U) {
        errorMessage = "Unsupported image depth (8-bit expected): " + path;
        return false;
    }

    cv::Mat bgra;
    try {
        switch (src.channels()) {
            case 1: cv::cvtColor(src, bgra, cv::COLOR_GRAY2BGRA); break;
            case 3: cv::cvtColor(src, bgra, cv::COLOR_BGR2BGRA); break;
            case 4: bgra = src; break;
            default:
                errorMessage = "Unsupported channel count " + std::to_string(src.channels()) + ": " + path;
                return false;
        }
    } catch (const cv::Exception& e) {
        errorMessage = std::string("Error converting image: ") + e.what();
        return false;
    }

    frame.width = bgra.cols;
    frame.height = bgra.rows;
    frame.strideBytes = bgra.cols * 4;
    frame.bgra.resize(static_cast<size_t>(frame.strideBytes) * static_cast<size_t>(frame.height));
    for (int y = 0; y < bgra.rows; ++y) {
        std::memcpy(frame.bgra.data() + static_cast<size_t>(y) * frame.strideBytes, bgra.ptr<uint8_t>(y),
                    static_cast<size_t>(frame.strideBytes));
    }
    return true;
}

} // namespace hud_advisor
