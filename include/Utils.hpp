#pragma once

#include "FrameBox.hpp"
#include <string>

namespace presence {
namespace utils {

/**
 * @brief Get current timestamp string (for filenames)
 * @param format Format string (default: "%Y%m%d_%H%M%S")
 * @return Timestamp string
 */
std::string get_timestamp_string(const std::string& format = "%Y%m%d_%H%M%S");

/**
 * @brief Local time as ISO-8601 with offset, e.g. 2024-03-01T08:15:02+0100
 */
std::string iso_timestamp();

/**
 * @brief Create directory if it doesn't exist
 * @param path Directory path
 * @return true if directory exists or was created
 */
bool ensure_directory_exists(const std::string& path);

/** Save a captured frame as PNG; returns the written path, or "" on failure */
std::string save_frame(const FrameBox& frame,
                       const std::string& directory,
                       const std::string& prefix = "frame");

} // namespace utils
} // namespace presence
