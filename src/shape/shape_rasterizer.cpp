#include "drop_synth/shape/shape_rasterizer.hpp"
#include "drop_synth/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>

namespace drop_synth::shape {

namespace {

const cv::Scalar kFill(1);

// Circle at (2r,3r) plus the upper half of an ellipse sharing its centre.
void draw_teardrop(cv::Mat& mask, int r, double axis_ratio, double angle) {
    const cv::Point center(2 * r, 3 * r);
    cv::circle(mask, center, r, kFill, cv::FILLED);
    const int long_axis = static_cast<int>(axis_ratio * std::sqrt(3.0) * r);
    cv::ellipse(mask, center, cv::Size(r, long_axis), angle, 180.0, 360.0, kFill, cv::FILLED);
}

void draw_default(cv::Mat& mask, int r) {
    draw_teardrop(mask, r, 1.3, 0.0);
}

void draw_round(cv::Mat& mask, int r) {
    cv::circle(mask, cv::Point(2 * r, 2 * r), r, kFill, cv::FILLED);
}

void draw_oval(cv::Mat& mask, int r, RandomSource& rng) {
    const int angle = rng.uniform_int(0, 179);
    const double aspect = rng.uniform_real(1.2, 2.0);
    const cv::Size axes(r, static_cast<int>(r * aspect));
    cv::ellipse(mask, cv::Point(2 * r, 2 * r), axes, angle, 0.0, 360.0, kFill, cv::FILLED);
}

void draw_random_teardrop(cv::Mat& mask, int r, RandomSource& rng) {
    const double ratio = rng.uniform_real(1.1, 1.5);
    const int angle_offset = rng.uniform_int(-15, 15);
    draw_teardrop(mask, r, ratio, angle_offset);
}

void draw_irregular(cv::Mat& mask, int r, RandomSource& rng) {
    const cv::Point center(2 * r, 2 * r);
    const int blobs = rng.uniform_int(3, 6);
    for (int i = 0; i < blobs; ++i) {
        const int dx = rng.uniform_int(-r / 3, r / 3);
        const int dy = rng.uniform_int(-r / 3, r / 3);
        const int blob_r = rng.uniform_int(r / 2, static_cast<int>(r * 0.8));
        cv::circle(mask, center + cv::Point(dx, dy), blob_r, kFill, cv::FILLED);
    }
}

void draw_splash(cv::Mat& mask, int r, RandomSource& rng) {
    const int core_r = static_cast<int>(r * 0.7);
    cv::circle(mask, cv::Point(2 * r, 2 * r), core_r, kFill, cv::FILLED);

    const int satellites = rng.uniform_int(2, 5);
    for (int i = 0; i < satellites; ++i) {
        const double angle = rng.uniform_real(0.0, 2.0 * CV_PI);
        const int distance = rng.uniform_int(core_r, static_cast<int>(r * 1.5));
        const int sx = static_cast<int>(2 * r + distance * std::cos(angle));
        const int sy = static_cast<int>(2 * r + distance * std::sin(angle));
        const int sat_r = rng.uniform_int(r / 4, r / 2);

        if (sx >= 0 && sx < mask.cols && sy >= 0 && sy < mask.rows) {
            cv::circle(mask, cv::Point(sx, sy), sat_r, kFill, cv::FILLED);
        }
    }
}

} // namespace

cv::Size droplet_mask_size(int radius) {
    return cv::Size(4 * radius, 5 * radius);
}

cv::Mat draw_shape(ShapeKind kind, int radius, RandomSource& rng) {
    if (radius <= 0) {
        throw ValidationError("droplet radius must be > 0, got " + std::to_string(radius));
    }

    cv::Mat mask = cv::Mat::zeros(droplet_mask_size(radius), CV_8U);
    switch (kind) {
        case ShapeKind::ROUND:
            draw_round(mask, radius);
            break;
        case ShapeKind::OVAL:
            draw_oval(mask, radius, rng);
            break;
        case ShapeKind::TEARDROP:
            draw_random_teardrop(mask, radius, rng);
            break;
        case ShapeKind::IRREGULAR:
            draw_irregular(mask, radius, rng);
            break;
        case ShapeKind::SPLASH:
            draw_splash(mask, radius, rng);
            break;
        case ShapeKind::DEFAULT:
        default:
            draw_default(mask, radius);
            break;
    }
    return mask;
}

cv::Mat derive_alpha(cv::Mat& label, RandomSource& rng) {
    return derive_alpha(label, rng.uniform_int(kAlphaBlurMin, kAlphaBlurMax));
}

cv::Mat derive_alpha(cv::Mat& label, int blur_sigma) {
    if (label.empty() || label.type() != CV_8U) {
        throw ValidationError("label mask must be a non-empty CV_8U image");
    }

    cv::Mat alpha;
    label.convertTo(alpha, CV_32F);
    cv::GaussianBlur(alpha, alpha, cv::Size(0, 0), blur_sigma, blur_sigma, cv::BORDER_REPLICATE);

    double max_val = 0.0;
    cv::minMaxLoc(alpha, nullptr, &max_val);
    if (max_val > 0.0) {
        alpha.convertTo(alpha, CV_32F, 255.0 / max_val);
        alpha = cv::min(cv::max(alpha, 0.0), 255.0);
    } else {
        alpha = cv::Mat::zeros(label.size(), CV_32F);
    }

    label.setTo(1, label > 0);
    return alpha;
}

ShapeMasks rasterize_shape(ShapeKind kind, int radius, RandomSource& rng) {
    ShapeMasks masks;
    masks.label = draw_shape(kind, radius, rng);
    masks.alpha = derive_alpha(masks.label, rng);
    return masks;
}

} // namespace drop_synth::shape
