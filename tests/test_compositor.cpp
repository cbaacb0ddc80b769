#include "drop_synth/compose/compositor.hpp"
#include "drop_synth/core/errors.hpp"

#include <opencv2/core.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using drop_synth::Droplet;
using drop_synth::config::Config;
namespace compose = drop_synth::compose;

// Flat droplet with constant alpha and a uniform texture colour.
static Droplet flat_droplet(int key, cv::Point center, cv::Size size, float alpha_value,
                            cv::Vec3b colour) {
    cv::Mat alpha(size, CV_32F, cv::Scalar(alpha_value));
    cv::Mat label(size, CV_8U, cv::Scalar(1));
    Droplet d = drop_synth::make_droplet_from_masks(key, center, alpha, label);
    d.texture = cv::Mat(size, CV_8UC4,
                        cv::Scalar(colour[0], colour[1], colour[2], static_cast<int>(alpha_value)));
    return d;
}

TEST_CASE("edge_weight_peaks_at_half_alpha") {
    REQUIRE(compose::edge_weight(0.0f) == Catch::Approx(0.0f));
    REQUIRE(compose::edge_weight(1.0f) == Catch::Approx(0.0f));
    REQUIRE(compose::edge_weight(0.5f) == Catch::Approx(1.0f));
}

TEST_CASE("composite_without_droplets_returns_identical_image") {
    cv::Mat src(60, 80, CV_8UC3, cv::Scalar(10, 20, 30));
    Config cfg;
    cfg.label.return_label = true;

    compose::CompositeResult r = compose::composite(src, {}, cfg);

    REQUIRE(cv::norm(r.image, src, cv::NORM_INF) == 0.0);
    REQUIRE(r.image.data != src.data);
    REQUIRE(r.label.size() == src.size());
    REQUIRE(cv::countNonZero(r.label) == 0);
}

TEST_CASE("composite_omits_label_unless_requested") {
    cv::Mat src(60, 80, CV_8UC3, cv::Scalar(0, 0, 0));
    Config cfg;
    compose::CompositeResult r = compose::composite(src, {}, cfg);
    REQUIRE(r.label.empty());
    REQUIRE(r.instances.empty());
}

TEST_CASE("blend_droplet_opaque_pixels_take_texture_colour") {
    cv::Mat out(50, 50, CV_8UC3, cv::Scalar(200, 200, 200));
    Droplet d = flat_droplet(1, cv::Point(25, 25), cv::Size(10, 10), 255.0f, cv::Vec3b(10, 20, 30));

    compose::blend_droplet(out, d, 0.3f);

    REQUIRE(out.at<cv::Vec3b>(25, 25) == cv::Vec3b(10, 20, 30));
    REQUIRE(out.at<cv::Vec3b>(0, 0) == cv::Vec3b(200, 200, 200));
}

TEST_CASE("blend_droplet_edge_ratio_darkens_soft_rim") {
    cv::Mat plain(50, 50, CV_8UC3, cv::Scalar(200, 200, 200));
    cv::Mat dark = plain.clone();
    Droplet d = flat_droplet(1, cv::Point(25, 25), cv::Size(10, 10), 128.0f, cv::Vec3b(200, 200, 200));

    compose::blend_droplet(plain, d, 0.0f);
    compose::blend_droplet(dark, d, 0.5f);

    REQUIRE(plain.at<cv::Vec3b>(25, 25) == cv::Vec3b(200, 200, 200));
    REQUIRE(dark.at<cv::Vec3b>(25, 25)[0] < 200);
    REQUIRE(dark.at<cv::Vec3b>(25, 25)[0] == 100);
}

TEST_CASE("blend_droplet_reads_texture_rows_bottom_up") {
    cv::Mat out(40, 40, CV_8UC3, cv::Scalar(0, 0, 0));
    Droplet d = flat_droplet(1, cv::Point(20, 20), cv::Size(8, 8), 255.0f, cv::Vec3b(0, 0, 0));
    for (int y = 0; y < d.texture.rows; ++y) {
        d.texture.row(y).setTo(cv::Scalar(y * 10, 0, 0, 255));
    }

    compose::blend_droplet(out, d, 0.0f);

    const cv::Rect box = d.bounding_box();
    REQUIRE(out.at<cv::Vec3b>(box.y, box.x)[0] == 70);
    REQUIRE(out.at<cv::Vec3b>(box.y + 7, box.x)[0] == 0);
}

TEST_CASE("blend_droplet_requires_texture") {
    cv::Mat out(20, 20, CV_8UC3, cv::Scalar(0, 0, 0));
    Droplet d = flat_droplet(1, cv::Point(10, 10), cv::Size(4, 4), 255.0f, cv::Vec3b(1, 1, 1));
    d.texture.release();
    REQUIRE_THROWS_AS(compose::blend_droplet(out, d, 0.3f), drop_synth::PipelineError);
}

TEST_CASE("accumulate_label_threshold_is_strict") {
    Droplet d = flat_droplet(3, cv::Point(20, 20), cv::Size(6, 6), 128.0f, cv::Vec3b(0, 0, 0));

    cv::Mat label = cv::Mat::zeros(40, 40, CV_8U);
    cv::Mat ids = cv::Mat::zeros(40, 40, CV_32S);
    compose::accumulate_label(label, ids, d, 128);
    REQUIRE(cv::countNonZero(label) == 0);

    compose::accumulate_label(label, ids, d, 127);
    REQUIRE(cv::countNonZero(label) == 36);
    REQUIRE(ids.at<int>(20, 20) == 3);
}

TEST_CASE("composite_clips_droplets_at_canvas_border") {
    cv::Mat src(30, 30, CV_8UC3, cv::Scalar(50, 50, 50));
    Config cfg;
    cfg.label.return_label = true;
    std::vector<Droplet> drops;
    drops.push_back(flat_droplet(1, cv::Point(1, 1), cv::Size(10, 10), 255.0f, cv::Vec3b(9, 9, 9)));

    compose::CompositeResult r = compose::composite(src, drops, cfg);

    REQUIRE(r.image.at<cv::Vec3b>(0, 0) == cv::Vec3b(9, 9, 9));
    REQUIRE(cv::countNonZero(r.label) == 36);
}

TEST_CASE("composite_rejects_non_rgb_source") {
    cv::Mat gray(10, 10, CV_8U, cv::Scalar(0));
    Config cfg;
    REQUIRE_THROWS_AS(compose::composite(gray, {}, cfg), drop_synth::ValidationError);
}
