#include "drop_synth/pipeline/augmentation.hpp"
#include "drop_synth/core/errors.hpp"
#include "drop_synth/pipeline/engine.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <utility>

namespace drop_synth::pipeline {

RaindropAugmentation::RaindropAugmentation(config::Config cfg)
    : cfg_(std::move(cfg)) {
    cfg_.label.return_label = false;
    cfg_.validate();
}

cv::Mat RaindropAugmentation::apply(const cv::Mat& image, RandomSource& rng) const {
    if (!rng.bernoulli(cfg_.augment.probability)) {
        return image;
    }

    const bool swap_channels = cfg_.augment.channel_order == ChannelOrder::BGR;
    try {
        cv::Mat rgb;
        if (swap_channels) {
            cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
        } else {
            rgb = image;
        }

        DropResult result = generate_drops(rgb, cfg_, rng);

        if (swap_channels) {
            cv::Mat bgr;
            cv::cvtColor(result.image, bgr, cv::COLOR_RGB2BGR);
            return bgr;
        }
        return result.image;
    } catch (const DropSynthError& e) {
        std::cerr << "[AUGMENT] Raindrop synthesis failed, keeping original: " << e.what() << std::endl;
    } catch (const cv::Exception& e) {
        std::cerr << "[AUGMENT] OpenCV failure, keeping original: " << e.what() << std::endl;
    }
    return image;
}

} // namespace drop_synth::pipeline
