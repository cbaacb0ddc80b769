#include "drop_synth/core/utils.hpp"
#include "drop_synth/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace drop_synth::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

bool is_image_file(const fs::path& path) {
    static const std::array<const char*, 4> kExtensions = {".png", ".jpg", ".jpeg", ".bmp"};
    const std::string name = to_lower(path.filename().string());
    for (const char* ext : kExtensions) {
        if (ends_with(name, ext)) return true;
    }
    return false;
}

std::vector<fs::path> discover_images(const fs::path& input_dir) {
    std::vector<fs::path> images;

    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        return images;
    }

    try {
        for (const auto& entry : fs::directory_iterator(input_dir)) {
            if (entry.is_regular_file() && is_image_file(entry.path())) {
                images.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError("Cannot list " + input_dir.string() + ": " + e.what());
    }

    std::sort(images.begin(), images.end());
    return images;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace drop_synth::core
