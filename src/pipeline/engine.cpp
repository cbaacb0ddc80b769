#include "drop_synth/pipeline/engine.hpp"
#include "drop_synth/compose/compositor.hpp"
#include "drop_synth/core/errors.hpp"
#include "drop_synth/texture/texture_warper.hpp"

#include <cstdint>
#include <iostream>

namespace drop_synth::pipeline {

namespace {

void check_image(const cv::Mat& image) {
    if (image.empty()) {
        throw ValidationError("input image is empty");
    }
    if (image.type() != CV_8UC3) {
        throw ValidationError("input image must be 8-bit 3-channel RGB");
    }
}

// Collision detection, texture warp and compositing for an already placed
// droplet set.
DropResult render(const cv::Mat& image, std::vector<Droplet> droplets, const config::Config& cfg) {
    DropResult result;
    result.collisions = placement::detect_collisions(droplets);

    for (auto& d : droplets) {
        const texture::WarpOutcome outcome = texture::apply_texture(d, image);
        if (outcome.fallback_used) {
            ++result.warp_fallbacks;
        }
    }

    compose::CompositeResult composite = compose::composite(image, droplets, cfg);
    result.image = std::move(composite.image);
    result.label = std::move(composite.label);
    result.instances = std::move(composite.instances);
    result.droplets = std::move(droplets);

    if (result.warp_fallbacks > 0) {
        std::cerr << "[DROPS] " << result.warp_fallbacks << "/" << result.droplets.size()
                  << " droplet(s) used the unwarped background" << std::endl;
    }
    return result;
}

} // namespace

DropResult generate_drops(const cv::Mat& image, const config::Config& cfg, RandomSource& rng) {
    cfg.validate();
    check_image(image);

    std::vector<Droplet> droplets = placement::scatter_droplets(image.size(), cfg, rng);
    return render(image, std::move(droplets), cfg);
}

DropResult generate_drops_with_label(const cv::Mat& image, const cv::Mat& label_image,
                                     const config::Config& cfg, RandomSource& rng) {
    cfg.validate();
    check_image(image);
    if (label_image.size() != image.size()) {
        throw ValidationError("input label image must match the image size");
    }

    std::vector<Droplet> droplets =
        placement::droplets_from_label_image(label_image, cfg.label.threshold, rng);
    return render(image, std::move(droplets), cfg);
}

RandomSource make_random_source(const config::Config& cfg) {
    if (cfg.random.seed < 0) {
        return RandomSource::from_entropy();
    }
    return RandomSource(static_cast<std::uint64_t>(cfg.random.seed));
}

} // namespace drop_synth::pipeline
