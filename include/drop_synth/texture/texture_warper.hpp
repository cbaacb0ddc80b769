#pragma once

#include "drop_synth/core/types.hpp"
#include "drop_synth/droplet/droplet.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace drop_synth::texture {

// Sigma of the out-of-focus blur applied to the background under a droplet.
constexpr double kBackgroundBlurSigma = 5.0;

struct WarpOutcome {
    bool fallback_used = false;
    std::string error_message;
};

/**
 * Canvas region under rect. Pixels outside the canvas are filled by edge
 * replication, so the result always has rect.size().
 */
cv::Mat extract_background(const cv::Mat& canvas, const cv::Rect& rect);

/**
 * Lens intrinsics for a droplet of the given radius over a w x h patch:
 * fx = 30r, fy = 20r, principal point at the patch centre.
 */
CameraMatrix lens_matrix(int radius, int width, int height);

// lens_matrix with the focal terms scaled by 2 * cbrt(radius).
CameraMatrix undistort_matrix(const CameraMatrix& K, int radius);

/**
 * Blur + radial lens warp of a background patch. Falls back to the blurred
 * patch when the warp cannot be computed; outcome reports which path ran.
 */
cv::Mat warp_background(const cv::Mat& patch, int radius, WarpOutcome* outcome = nullptr);

/**
 * Build the droplet's RGBA tile from the canvas: warped background plus the
 * droplet's alpha, flipped top-bottom (rows stored bottom-up).
 */
cv::Mat build_texture(const Droplet& droplet, const cv::Mat& canvas, WarpOutcome* outcome = nullptr);

// build_texture, stored into droplet.texture.
WarpOutcome apply_texture(Droplet& droplet, const cv::Mat& canvas);

} // namespace drop_synth::texture
