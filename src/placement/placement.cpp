#include "drop_synth/placement/placement.hpp"
#include "drop_synth/core/errors.hpp"
#include "drop_synth/shape/shape_rasterizer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iostream>

namespace drop_synth::placement {

void CollisionTable::add(int a, int b) {
    if (a == b) return;
    partners_[a].insert(b);
    partners_[b].insert(a);
}

bool CollisionTable::collides(int key) const {
    auto it = partners_.find(key);
    return it != partners_.end() && !it->second.empty();
}

const std::set<int>& CollisionTable::partners(int key) const {
    static const std::set<int> kNone;
    auto it = partners_.find(key);
    return it == partners_.end() ? kNone : it->second;
}

size_t CollisionTable::pair_count() const {
    size_t n = 0;
    for (const auto& [key, others] : partners_) {
        n += others.size();
    }
    return n / 2;
}

std::vector<Droplet> scatter_droplets(cv::Size canvas, const config::Config& cfg, RandomSource& rng) {
    std::vector<Droplet> droplets;
    const int count = rng.uniform_int(cfg.drops.min_count, cfg.drops.max_count);
    if (count <= 0) {
        return droplets;
    }

    // Largest radius whose 4r x 5r box still fits the canvas.
    const int max_fit = std::min(canvas.width / 4, canvas.height / 5);
    if (max_fit < 1) {
        std::cerr << "[DROPS] Canvas " << canvas.width << "x" << canvas.height
                  << " too small for any droplet, skipping " << count << " drops" << std::endl;
        return droplets;
    }

    droplets.reserve(static_cast<size_t>(count));
    int clamped = 0;
    for (int i = 0; i < count; ++i) {
        int radius = rng.uniform_int(cfg.drops.min_radius, cfg.drops.max_radius);
        if (radius > max_fit) {
            radius = max_fit;
            ++clamped;
        }

        const ShapeKind kind = cfg.shape.variety ? rng.pick(cfg.shape.allowed) : cfg.shape.fixed;

        const int x = rng.uniform_int(2 * radius, canvas.width - 2 * radius);
        const int y = rng.uniform_int(3 * radius, canvas.height - 2 * radius);

        droplets.push_back(make_droplet(i + 1, cv::Point(x, y), radius, kind, rng));
    }

    if (clamped > 0) {
        std::cerr << "[DROPS] Clamped radius of " << clamped << " droplet(s) to " << max_fit
                  << " px to fit " << canvas.width << "x" << canvas.height << std::endl;
    }
    return droplets;
}

std::vector<Droplet> droplets_from_label_image(const cv::Mat& label_image, int threshold,
                                               RandomSource& rng) {
    if (label_image.empty()) {
        throw ValidationError("input label image is empty");
    }

    cv::Mat gray;
    if (label_image.channels() == 3) {
        cv::cvtColor(label_image, gray, cv::COLOR_RGB2GRAY);
    } else if (label_image.channels() == 1) {
        gray = label_image;
    } else {
        throw ValidationError("input label image must have 1 or 3 channels");
    }
    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }

    cv::Mat binary;
    cv::threshold(gray, binary, threshold, 1, cv::THRESH_BINARY);

    cv::Mat components, stats, centroids;
    const int n = cv::connectedComponentsWithStats(binary, components, stats, centroids, 8, CV_32S);

    std::vector<Droplet> droplets;
    for (int i = 1; i < n; ++i) {
        const cv::Rect box(stats.at<int>(i, cv::CC_STAT_LEFT),
                           stats.at<int>(i, cv::CC_STAT_TOP),
                           stats.at<int>(i, cv::CC_STAT_WIDTH),
                           stats.at<int>(i, cv::CC_STAT_HEIGHT));

        cv::Mat label;
        cv::compare(components(box), i, label, cv::CMP_EQ);
        label /= 255;
        cv::Mat alpha = shape::derive_alpha(label, rng);

        const cv::Point center(box.x + box.width / 2, box.y + box.height / 2);
        droplets.push_back(make_droplet_from_masks(i, center, alpha, label));
    }
    return droplets;
}

bool masks_overlap(const Droplet& a, const Droplet& b) {
    const cv::Rect ra = a.bounding_box();
    const cv::Rect rb = b.bounding_box();
    const cv::Rect inter = ra & rb;
    if (inter.empty()) {
        return false;
    }

    cv::Mat both;
    cv::bitwise_and(a.label_mask(inter - ra.tl()), b.label_mask(inter - rb.tl()), both);
    return cv::countNonZero(both) > 0;
}

CollisionTable detect_collisions(const std::vector<Droplet>& droplets) {
    CollisionTable table;
    for (size_t i = 0; i < droplets.size(); ++i) {
        for (size_t j = i + 1; j < droplets.size(); ++j) {
            if (masks_overlap(droplets[i], droplets[j])) {
                table.add(droplets[i].key, droplets[j].key);
            }
        }
    }
    return table;
}

} // namespace drop_synth::placement
