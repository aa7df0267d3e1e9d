#pragma once
/**
 * @file image_loader.h
 * @brief Static image loading for offline frames
 */

#include "types.h"

#include <string>

namespace hud_advisor {

/**
 * @brief Load an image file as an owned BGRA frame
 *
 * Gray, BGR and BGRA sources are all converted to 4 channels.
 *
 * @param path Image path (PNG, JPEG, BMP, ...)
 * @param frame Receives the pixels on success
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool loadFrameBGRA(const std::string& path, Frame& frame, std::string& errorMessage);

} // namespace hud_advisor
