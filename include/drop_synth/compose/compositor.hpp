#pragma once

#include "drop_synth/config/configuration.hpp"
#include "drop_synth/droplet/droplet.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace drop_synth::compose {

struct CompositeResult {
    cv::Mat image;      // CV_8UC3, same size and channel order as the source
    cv::Mat label;      // CV_8U {0,1}; empty unless labels were requested
    cv::Mat instances;  // CV_32S droplet keys; empty unless labels were requested
};

// Rim shading weight for a normalised alpha a in [0,1]: 4a(1-a).
inline float edge_weight(float a) {
    return 4.0f * a * (1.0f - a);
}

/**
 * Alpha-blend one textured droplet into out (CV_8UC3) and darken its soft
 * rim by edge_dark_ratio. Pixels with zero alpha are left untouched.
 */
void blend_droplet(cv::Mat& out, const Droplet& droplet, float edge_dark_ratio);

/**
 * OR the droplet's thresholded coverage (alpha inside its label mask,
 * strictly above threshold) into label, and stamp its key into instances.
 */
void accumulate_label(cv::Mat& label, cv::Mat& instances, const Droplet& droplet, int threshold);

/**
 * Paste every droplet in order onto a copy of source. Every droplet must
 * already carry its texture.
 */
CompositeResult composite(const cv::Mat& source, const std::vector<Droplet>& droplets,
                          const config::Config& cfg);

} // namespace drop_synth::compose
