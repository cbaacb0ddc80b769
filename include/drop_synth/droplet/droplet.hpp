#pragma once

#include "drop_synth/core/random.hpp"
#include "drop_synth/core/types.hpp"

#include <opencv2/core.hpp>

namespace drop_synth {

/**
 * One simulated raindrop.
 *
 * label_mask (CV_8U, {0,1}) and alpha_mask (CV_32F, [0,255]) always share a
 * size and are fixed once the droplet is built. texture (CV_8UC4, stored
 * bottom-up) stays empty until the texture warper fills it.
 */
struct Droplet {
    int key = 0;
    ShapeKind shape = ShapeKind::DEFAULT;
    cv::Point center;
    int radius = 0;
    cv::Point anchor;       // position of center inside the masks
    cv::Mat label_mask;
    cv::Mat alpha_mask;
    cv::Mat texture;
    bool uses_external_label = false;

    // Canvas rectangle covered by the masks.
    cv::Rect bounding_box() const {
        return cv::Rect(center - anchor, label_mask.size());
    }

    bool has_texture() const { return !texture.empty(); }
};

// Procedurally rasterised droplet; the masks are 4r x 5r with center at (2r,3r).
Droplet make_droplet(int key, cv::Point center, int radius, ShapeKind kind, RandomSource& rng);

// Droplet built from caller-supplied masks; radius = min(cols/4, rows/4).
Droplet make_droplet_from_masks(int key, cv::Point center, const cv::Mat& alpha, const cv::Mat& label);

} // namespace drop_synth
