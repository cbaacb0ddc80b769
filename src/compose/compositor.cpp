#include "drop_synth/compose/compositor.hpp"
#include "drop_synth/core/errors.hpp"

namespace drop_synth::compose {

void blend_droplet(cv::Mat& out, const Droplet& droplet, float edge_dark_ratio) {
    if (!droplet.has_texture()) {
        throw PipelineError("droplet " + std::to_string(droplet.key) + " has no texture");
    }
    const cv::Mat& tile = droplet.texture;
    if (tile.type() != CV_8UC4 || tile.size() != droplet.alpha_mask.size()) {
        throw PipelineError("droplet " + std::to_string(droplet.key) + " has a malformed texture");
    }

    const cv::Rect box = droplet.bounding_box();
    const cv::Rect inside = box & cv::Rect(0, 0, out.cols, out.rows);

    for (int y = inside.y; y < inside.y + inside.height; ++y) {
        // Tiles are stored bottom-up.
        const int ty = tile.rows - 1 - (y - box.y);
        const cv::Vec4b* trow = tile.ptr<cv::Vec4b>(ty);
        cv::Vec3b* orow = out.ptr<cv::Vec3b>(y);
        for (int x = inside.x; x < inside.x + inside.width; ++x) {
            const cv::Vec4b& t = trow[x - box.x];
            if (t[3] == 0) continue;

            const float a = t[3] / 255.0f;
            const float shade = 1.0f - edge_dark_ratio * edge_weight(a);
            cv::Vec3b& p = orow[x];
            for (int c = 0; c < 3; ++c) {
                const float v = ((1.0f - a) * p[c] + a * t[c]) * shade;
                p[c] = cv::saturate_cast<uchar>(v);
            }
        }
    }
}

void accumulate_label(cv::Mat& label, cv::Mat& instances, const Droplet& droplet, int threshold) {
    const cv::Rect box = droplet.bounding_box();
    const cv::Rect inside = box & cv::Rect(0, 0, label.cols, label.rows);
    const float thres = static_cast<float>(threshold);

    for (int y = inside.y; y < inside.y + inside.height; ++y) {
        const int ly = y - box.y;
        const uchar* lrow = droplet.label_mask.ptr<uchar>(ly);
        const float* arow = droplet.alpha_mask.ptr<float>(ly);
        uchar* out = label.ptr<uchar>(y);
        int* ids = instances.ptr<int>(y);
        for (int x = inside.x; x < inside.x + inside.width; ++x) {
            const int lx = x - box.x;
            if (lrow[lx] == 0 || arow[lx] <= thres) continue;
            out[x] = 1;
            ids[x] = droplet.key;
        }
    }
}

CompositeResult composite(const cv::Mat& source, const std::vector<Droplet>& droplets,
                          const config::Config& cfg) {
    if (source.empty() || source.type() != CV_8UC3) {
        throw ValidationError("source image must be a non-empty 8-bit 3-channel image");
    }

    CompositeResult result;
    result.image = source.clone();
    for (const auto& d : droplets) {
        blend_droplet(result.image, d, cfg.compose.edge_dark_ratio);
    }

    if (cfg.label.return_label) {
        result.label = cv::Mat::zeros(source.size(), CV_8U);
        result.instances = cv::Mat::zeros(source.size(), CV_32S);
        for (const auto& d : droplets) {
            accumulate_label(result.label, result.instances, d, cfg.label.threshold);
        }
    }

    return result;
}

} // namespace drop_synth::compose
