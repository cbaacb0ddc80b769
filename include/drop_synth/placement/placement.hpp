#pragma once

#include "drop_synth/config/configuration.hpp"
#include "drop_synth/core/random.hpp"
#include "drop_synth/droplet/droplet.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <set>
#include <vector>

namespace drop_synth::placement {

/**
 * Overlap relation between droplets of one run, keyed by droplet key.
 * Symmetric: add(a, b) records b under a and a under b.
 */
class CollisionTable {
public:
    void add(int a, int b);

    bool collides(int key) const;
    const std::set<int>& partners(int key) const;

    // Number of unordered colliding pairs.
    size_t pair_count() const;
    bool empty() const { return partners_.empty(); }

    const std::map<int, std::set<int>>& relation() const { return partners_; }

private:
    std::map<int, std::set<int>> partners_;
};

/**
 * Draw droplet count, radii, shapes and centres for a canvas. Every
 * bounding box lies inside the canvas; keys start at 1 in placement order.
 */
std::vector<Droplet> scatter_droplets(cv::Size canvas, const config::Config& cfg, RandomSource& rng);

/**
 * Build external droplets from a single-channel label image: pixels above
 * threshold are split into 8-connected components, one droplet each.
 */
std::vector<Droplet> droplets_from_label_image(const cv::Mat& label_image, int threshold,
                                               RandomSource& rng);

/**
 * Two droplets collide when their label masks share a nonzero canvas pixel.
 * Informational only: droplets are neither merged nor reordered.
 */
CollisionTable detect_collisions(const std::vector<Droplet>& droplets);

bool masks_overlap(const Droplet& a, const Droplet& b);

} // namespace drop_synth::placement
