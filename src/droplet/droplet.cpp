#include "drop_synth/droplet/droplet.hpp"
#include "drop_synth/core/errors.hpp"
#include "drop_synth/shape/shape_rasterizer.hpp"

#include <algorithm>

namespace drop_synth {

Droplet make_droplet(int key, cv::Point center, int radius, ShapeKind kind, RandomSource& rng) {
    ShapeMasks masks = shape::rasterize_shape(kind, radius, rng);

    Droplet d;
    d.key = key;
    d.shape = kind;
    d.center = center;
    d.radius = radius;
    d.anchor = cv::Point(2 * radius, 3 * radius);
    d.label_mask = std::move(masks.label);
    d.alpha_mask = std::move(masks.alpha);
    d.uses_external_label = false;
    return d;
}

Droplet make_droplet_from_masks(int key, cv::Point center, const cv::Mat& alpha, const cv::Mat& label) {
    if (alpha.empty() || label.empty()) {
        throw ValidationError("external droplet masks must not be empty");
    }
    if (alpha.size() != label.size()) {
        throw ValidationError("external alpha and label masks differ in size");
    }
    if (alpha.channels() != 1 || label.channels() != 1) {
        throw ValidationError("external droplet masks must be single-channel");
    }

    Droplet d;
    d.key = key;
    d.shape = ShapeKind::DEFAULT;
    d.center = center;
    d.radius = std::min(label.cols / 4, label.rows / 4);
    d.anchor = cv::Point(label.cols / 2, label.rows / 2);

    label.convertTo(d.label_mask, CV_8U);
    d.label_mask.setTo(1, d.label_mask > 0);
    alpha.convertTo(d.alpha_mask, CV_32F);
    d.alpha_mask = cv::min(cv::max(d.alpha_mask, 0.0), 255.0);
    d.uses_external_label = true;
    return d;
}

} // namespace drop_synth
