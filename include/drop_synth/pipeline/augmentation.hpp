#pragma once

#include "drop_synth/config/configuration.hpp"
#include "drop_synth/core/random.hpp"

#include <opencv2/core.hpp>

namespace drop_synth::pipeline {

/**
 * Training-time transform: with probability cfg.augment.probability,
 * overlays raindrops on an image given in cfg.augment.channel_order.
 * Per-image failures are logged and the input is returned unchanged.
 */
class RaindropAugmentation {
public:
    explicit RaindropAugmentation(config::Config cfg);

    cv::Mat apply(const cv::Mat& image, RandomSource& rng) const;

    const config::Config& config() const { return cfg_; }

private:
    config::Config cfg_;
};

} // namespace drop_synth::pipeline
