#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace drop_synth {

// Pinhole intrinsics used by the lens warp
using CameraMatrix = Eigen::Matrix3d;

// Droplet morphologies
enum class ShapeKind {
    DEFAULT,
    ROUND,
    OVAL,
    TEARDROP,
    IRREGULAR,
    SPLASH
};

inline std::string shape_kind_to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::DEFAULT: return "default";
        case ShapeKind::ROUND: return "round";
        case ShapeKind::OVAL: return "oval";
        case ShapeKind::TEARDROP: return "teardrop";
        case ShapeKind::IRREGULAR: return "irregular";
        case ShapeKind::SPLASH: return "splash";
        default: return "unknown";
    }
}

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

inline std::optional<ShapeKind> string_to_shape_kind(const std::string& s) {
    const std::string norm = normalize_token(s);
    if (norm == "default") return ShapeKind::DEFAULT;
    if (norm == "round") return ShapeKind::ROUND;
    if (norm == "oval") return ShapeKind::OVAL;
    if (norm == "teardrop") return ShapeKind::TEARDROP;
    if (norm == "irregular") return ShapeKind::IRREGULAR;
    if (norm == "splash") return ShapeKind::SPLASH;
    return std::nullopt;
}

inline std::vector<ShapeKind> all_shape_kinds() {
    return {ShapeKind::DEFAULT, ShapeKind::ROUND, ShapeKind::OVAL,
            ShapeKind::TEARDROP, ShapeKind::IRREGULAR, ShapeKind::SPLASH};
}

// Channel layout of 3-channel 8-bit images handed to the augmentation
enum class ChannelOrder {
    RGB,
    BGR
};

inline std::string channel_order_to_string(ChannelOrder order) {
    switch (order) {
        case ChannelOrder::RGB: return "RGB";
        case ChannelOrder::BGR: return "BGR";
        default: return "UNKNOWN";
    }
}

inline std::optional<ChannelOrder> string_to_channel_order(const std::string& s) {
    const std::string norm = normalize_token(s);
    if (norm == "rgb") return ChannelOrder::RGB;
    if (norm == "bgr") return ChannelOrder::BGR;
    return std::nullopt;
}

// Binary masks are CV_8U with values {0,1}; alpha masks are CV_32F in [0,255].
struct ShapeMasks {
    cv::Mat label;
    cv::Mat alpha;
};

} // namespace drop_synth
