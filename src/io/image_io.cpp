#include "drop_synth/io/image_io.hpp"
#include "drop_synth/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace drop_synth::io {

static void ensure_parent_dir(const fs::path& path) {
    if (!path.has_parent_path()) {
        return;
    }
    try {
        fs::create_directories(path.parent_path());
    } catch (const fs::filesystem_error& e) {
        throw IOError(path.string() + ": " + e.what());
    }
}

cv::Mat read_rgb(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Image not found: " + path.string());
    }
    cv::Mat bgr = cv::imread(path.string(), cv::IMREAD_COLOR);
    if (bgr.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

void write_rgb(const fs::path& path, const cv::Mat& rgb) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw IOError("Refusing to write non-RGB image to " + path.string());
    }
    ensure_parent_dir(path);
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    if (!cv::imwrite(path.string(), bgr)) {
        throw IOError("Cannot write image: " + path.string());
    }
}

cv::Mat read_label(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Label image not found: " + path.string());
    }
    cv::Mat label = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
    if (label.empty()) {
        throw IOError("Cannot decode label image: " + path.string());
    }
    return label;
}

void write_label(const fs::path& path, const cv::Mat& label) {
    if (label.empty() || label.type() != CV_8U) {
        throw IOError("Refusing to write non-8-bit label to " + path.string());
    }
    ensure_parent_dir(path);
    cv::Mat visible;
    label.convertTo(visible, CV_8U, 255.0);
    if (!cv::imwrite(path.string(), visible)) {
        throw IOError("Cannot write label: " + path.string());
    }
}

} // namespace drop_synth::io
