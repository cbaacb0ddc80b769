#include "drop_synth/texture/texture_warper.hpp"
#include "drop_synth/core/errors.hpp"

#include <opencv2/calib3d.hpp>
#include <opencv2/core/eigen.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <iostream>
#include <vector>

namespace drop_synth::texture {

cv::Mat extract_background(const cv::Mat& canvas, const cv::Rect& rect) {
    if (canvas.empty() || rect.width <= 0 || rect.height <= 0) {
        throw ValidationError("cannot extract background from an empty canvas or rectangle");
    }

    const cv::Rect bounds(0, 0, canvas.cols, canvas.rows);
    const cv::Rect inside = rect & bounds;
    if (inside.empty()) {
        return cv::Mat(rect.size(), canvas.type(), cv::Scalar::all(0));
    }
    if (inside == rect) {
        return canvas(rect).clone();
    }

    const int top = inside.y - rect.y;
    const int left = inside.x - rect.x;
    const int bottom = rect.br().y - inside.br().y;
    const int right = rect.br().x - inside.br().x;

    cv::Mat out;
    cv::copyMakeBorder(canvas(inside), out, top, bottom, left, right, cv::BORDER_REPLICATE);
    return out;
}

CameraMatrix lens_matrix(int radius, int width, int height) {
    CameraMatrix K = CameraMatrix::Identity();
    K(0, 0) = 30.0 * radius;
    K(1, 1) = 20.0 * radius;
    K(0, 2) = width / 2.0;
    K(1, 2) = height / 2.0;
    return K;
}

CameraMatrix undistort_matrix(const CameraMatrix& K, int radius) {
    const double scale = std::pow(static_cast<double>(radius), 1.0 / 3.0) * 2.0;
    CameraMatrix Knew = K;
    Knew(0, 0) = K(0, 0) * scale;
    Knew(1, 1) = K(1, 1) * scale;
    return Knew;
}

static cv::Mat fisheye_undistort(const cv::Mat& img, int radius) {
    if (radius <= 0) {
        throw WarpError("non-positive droplet radius " + std::to_string(radius));
    }

    const CameraMatrix K = lens_matrix(radius, img.cols, img.rows);
    const CameraMatrix Knew = undistort_matrix(K, radius);
    if (std::abs(K.determinant()) < 1e-12 || std::abs(Knew.determinant()) < 1e-12) {
        throw WarpError("singular lens matrix");
    }

    cv::Mat K_cv, Knew_cv;
    cv::eigen2cv(K, K_cv);
    cv::eigen2cv(Knew, Knew_cv);
    const cv::Mat D = cv::Mat::zeros(4, 1, CV_64F);

    cv::Mat warped;
    cv::fisheye::undistortImage(img, warped, K_cv, D, Knew_cv, img.size());
    if (warped.empty()) {
        throw WarpError("undistortImage produced an empty image");
    }
    return warped;
}

cv::Mat warp_background(const cv::Mat& patch, int radius, WarpOutcome* outcome) {
    if (patch.empty()) {
        throw ValidationError("background patch is empty");
    }

    cv::Mat blurred;
    cv::GaussianBlur(patch, blurred, cv::Size(0, 0), kBackgroundBlurSigma);

    std::string failure;
    try {
        cv::Mat warped = fisheye_undistort(blurred, radius);
        if (outcome) *outcome = WarpOutcome{};
        return warped;
    } catch (const WarpError& e) {
        failure = e.what();
    } catch (const cv::Exception& e) {
        failure = std::string("OpenCV: ") + e.what();
    }

    std::cerr << "[WARP] Lens warp failed (" << failure
              << "), using the blurred background" << std::endl;
    if (outcome) {
        outcome->fallback_used = true;
        outcome->error_message = failure;
    }
    return blurred;
}

cv::Mat build_texture(const Droplet& droplet, const cv::Mat& canvas, WarpOutcome* outcome) {
    if (canvas.type() != CV_8UC3) {
        throw ValidationError("canvas must be an 8-bit 3-channel image");
    }

    const cv::Mat patch = extract_background(canvas, droplet.bounding_box());
    cv::Mat warped = warp_background(patch, droplet.radius, outcome);
    if (warped.size() != droplet.alpha_mask.size()) {
        cv::resize(warped, warped, droplet.alpha_mask.size());
    }

    cv::Mat alpha8;
    droplet.alpha_mask.convertTo(alpha8, CV_8U);

    std::vector<cv::Mat> channels;
    cv::split(warped, channels);
    channels.push_back(alpha8);

    cv::Mat tile;
    cv::merge(channels, tile);
    cv::flip(tile, tile, 0);
    return tile;
}

WarpOutcome apply_texture(Droplet& droplet, const cv::Mat& canvas) {
    WarpOutcome outcome;
    droplet.texture = build_texture(droplet, canvas, &outcome);
    return outcome;
}

} // namespace drop_synth::texture
