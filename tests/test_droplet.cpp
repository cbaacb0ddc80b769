#include "drop_synth/droplet/droplet.hpp"
#include "drop_synth/core/errors.hpp"

#include <opencv2/core.hpp>

#include <catch2/catch_test_macros.hpp>

using drop_synth::Droplet;
using drop_synth::RandomSource;
using drop_synth::ShapeKind;

TEST_CASE("make_droplet_anchors_center_at_2r_3r") {
    RandomSource rng(21);
    Droplet d = drop_synth::make_droplet(4, cv::Point(100, 120), 15, ShapeKind::OVAL, rng);

    REQUIRE(d.key == 4);
    REQUIRE(d.shape == ShapeKind::OVAL);
    REQUIRE(d.radius == 15);
    REQUIRE(d.anchor == cv::Point(30, 45));
    REQUIRE_FALSE(d.uses_external_label);
    REQUIRE_FALSE(d.has_texture());

    cv::Rect box = d.bounding_box();
    REQUIRE(box == cv::Rect(70, 75, 60, 75));
}

TEST_CASE("make_droplet_from_masks_radius_is_quarter_of_shorter_side") {
    cv::Mat alpha(200, 160, CV_32F, cv::Scalar(100.0f));
    cv::Mat label(200, 160, CV_8U, cv::Scalar(1));

    Droplet d = drop_synth::make_droplet_from_masks(1, cv::Point(300, 300), alpha, label);

    REQUIRE(d.radius == 40);
    REQUIRE(d.anchor == cv::Point(80, 100));
    REQUIRE(d.uses_external_label);
    REQUIRE(d.bounding_box() == cv::Rect(220, 200, 160, 200));
}

TEST_CASE("make_droplet_from_masks_normalises_label_and_alpha") {
    cv::Mat alpha(8, 8, CV_8U, cv::Scalar(255));
    cv::Mat label = cv::Mat::zeros(8, 8, CV_8U);
    label(cv::Rect(2, 2, 4, 4)).setTo(255);

    Droplet d = drop_synth::make_droplet_from_masks(2, cv::Point(10, 10), alpha, label);

    REQUIRE(d.label_mask.type() == CV_8U);
    REQUIRE(d.alpha_mask.type() == CV_32F);
    REQUIRE(d.label_mask.at<uchar>(3, 3) == 1);
    REQUIRE(d.label_mask.at<uchar>(0, 0) == 0);
    REQUIRE(d.alpha_mask.at<float>(0, 0) == 255.0f);
}

TEST_CASE("make_droplet_from_masks_rejects_mismatched_masks") {
    cv::Mat alpha(10, 12, CV_32F, cv::Scalar(1.0f));
    cv::Mat label(12, 10, CV_8U, cv::Scalar(1));
    REQUIRE_THROWS_AS(drop_synth::make_droplet_from_masks(1, cv::Point(0, 0), alpha, label),
                      drop_synth::ValidationError);
    REQUIRE_THROWS_AS(drop_synth::make_droplet_from_masks(1, cv::Point(0, 0), cv::Mat(), label),
                      drop_synth::ValidationError);
}
