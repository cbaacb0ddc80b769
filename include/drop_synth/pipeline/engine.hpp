#pragma once

#include "drop_synth/config/configuration.hpp"
#include "drop_synth/core/random.hpp"
#include "drop_synth/droplet/droplet.hpp"
#include "drop_synth/placement/placement.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace drop_synth::pipeline {

struct DropResult {
    cv::Mat image;                          // composited, same size and channel order as input
    cv::Mat label;                          // CV_8U {0,1}, empty unless cfg.label.return_label
    cv::Mat instances;                      // CV_32S droplet keys, empty unless cfg.label.return_label
    std::vector<Droplet> droplets;          // placement order
    placement::CollisionTable collisions;
    int warp_fallbacks = 0;
};

/**
 * Synthesise raindrops over an RGB image (CV_8UC3).
 * Validates cfg before drawing; ValidationError on bad config or input.
 */
DropResult generate_drops(const cv::Mat& image, const config::Config& cfg, RandomSource& rng);

/**
 * As generate_drops, but the droplets are the connected components of a
 * caller-supplied label image (thresholded by cfg.label.threshold).
 */
DropResult generate_drops_with_label(const cv::Mat& image, const cv::Mat& label_image,
                                     const config::Config& cfg, RandomSource& rng);

// Seeded from cfg.random.seed, or from entropy when the seed is negative.
RandomSource make_random_source(const config::Config& cfg);

} // namespace drop_synth::pipeline
