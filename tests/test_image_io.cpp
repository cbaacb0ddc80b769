#include "drop_synth/io/image_io.hpp"
#include "drop_synth/core/errors.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <fstream>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace io = drop_synth::io;

TEST_CASE("write_rgb_then_read_rgb_keeps_channel_order") {
    fs::path dir = fs::temp_directory_path() / "drop_synth_test_io";
    fs::remove_all(dir);
    cv::Mat rgb(16, 16, CV_8UC3, cv::Scalar(200, 100, 10));

    io::write_rgb(dir / "out" / "img.png", rgb);
    cv::Mat back = io::read_rgb(dir / "out" / "img.png");

    REQUIRE(back.type() == CV_8UC3);
    REQUIRE(back.at<cv::Vec3b>(0, 0) == cv::Vec3b(200, 100, 10));
    fs::remove_all(dir);
}

TEST_CASE("write_label_stores_mask_as_0_255") {
    fs::path dir = fs::temp_directory_path() / "drop_synth_test_label_io";
    fs::remove_all(dir);
    cv::Mat label = cv::Mat::zeros(10, 10, CV_8U);
    label.at<uchar>(4, 4) = 1;

    io::write_label(dir / "label.png", label);
    cv::Mat back = io::read_label(dir / "label.png");

    REQUIRE(back.at<uchar>(4, 4) == 255);
    REQUIRE(back.at<uchar>(0, 0) == 0);
    fs::remove_all(dir);
}

TEST_CASE("write_rgb_reports_unusable_parent_directory_as_io_error") {
    fs::path dir = fs::temp_directory_path() / "drop_synth_test_parent_is_file";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "blocker") << "x";
    cv::Mat rgb(8, 8, CV_8UC3, cv::Scalar(1, 2, 3));
    cv::Mat label = cv::Mat::zeros(8, 8, CV_8U);

    REQUIRE_THROWS_AS(io::write_rgb(dir / "blocker" / "img.png", rgb), drop_synth::IOError);
    REQUIRE_THROWS_AS(io::write_label(dir / "blocker" / "sub" / "label.png", label),
                      drop_synth::IOError);
    fs::remove_all(dir);
}

TEST_CASE("image_io_reports_missing_and_invalid_inputs") {
    REQUIRE_THROWS_AS(io::read_rgb("/nonexistent/img.png"), drop_synth::IOError);
    REQUIRE_THROWS_AS(io::read_label("/nonexistent/label.png"), drop_synth::IOError);
    cv::Mat gray(4, 4, CV_8U, cv::Scalar(0));
    REQUIRE_THROWS_AS(io::write_rgb(fs::temp_directory_path() / "x.png", gray), drop_synth::IOError);
}
