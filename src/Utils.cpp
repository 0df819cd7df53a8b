#include "Utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <sys/stat.h>
#include <sys/types.h>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace presence {
namespace utils {

std::string get_timestamp_string(const std::string& format) {
    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);
    
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

std::string iso_timestamp() {
    return get_timestamp_string("%Y-%m-%dT%H:%M:%S%z");
}

bool ensure_directory_exists(const std::string& path) {
    struct stat info;
    
    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }
    
    // Try to create directory
    return mkdir(path.c_str(), 0755) == 0;
}

std::string save_frame(const FrameBox& frame,
                       const std::string& directory,
                       const std::string& prefix) {
    if (!frame.is_valid()) {
        return "";
    }
    if (!ensure_directory_exists(directory)) {
        std::cerr << "⚠ Cannot create directory: " << directory << std::endl;
        return "";
    }

    std::string path = directory + "/" + prefix + "_" + get_timestamp_string() + "_" +
                       std::to_string(frame.sequence_id) + ".png";
    try {
        if (!cv::imwrite(path, frame.to_mat())) {
            return "";
        }
    } catch (const cv::Exception& e) {
        std::cerr << "⚠ Failed to save frame: " << e.what() << std::endl;
        return "";
    }
    return path;
}

} // namespace utils
} // namespace presence
