#pragma once

#include <opencv2/core.hpp>

#include <filesystem>

namespace drop_synth::io {

namespace fs = std::filesystem;

// 8-bit RGB image (OpenCV decodes BGR; channels are swapped on the way in/out).
cv::Mat read_rgb(const fs::path& path);
void write_rgb(const fs::path& path, const cv::Mat& rgb);

// Single-channel 8-bit label image as stored on disk.
cv::Mat read_label(const fs::path& path);

// {0,1} label written as {0,255} so the mask is visible.
void write_label(const fs::path& path, const cv::Mat& label);

} // namespace drop_synth::io
