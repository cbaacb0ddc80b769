#pragma once

#include "drop_synth/core/random.hpp"
#include "drop_synth/core/types.hpp"

#include <opencv2/core.hpp>

namespace drop_synth::shape {

// Blur sigma range of the shared alpha derivation.
constexpr int kAlphaBlurMin = 8;
constexpr int kAlphaBlurMax = 12;

/**
 * Mask extent of a procedural droplet: 4r columns by 5r rows.
 */
cv::Size droplet_mask_size(int radius);

/**
 * Draw the binary occupancy mask (CV_8U, values {0,1}) of one droplet.
 * Shape-specific parameters are drawn from rng.
 */
cv::Mat draw_shape(ShapeKind kind, int radius, RandomSource& rng);

/**
 * Shared alpha derivation. Blurs the label with a Gaussian whose sigma is
 * drawn from [kAlphaBlurMin, kAlphaBlurMax], rescales so the maximum is 255
 * (all-zero input gives all-zero alpha) and binarises label in place.
 * Returns CV_32F alpha of the same size.
 */
cv::Mat derive_alpha(cv::Mat& label, RandomSource& rng);

// Same derivation with an explicit blur sigma.
cv::Mat derive_alpha(cv::Mat& label, int blur_sigma);

/**
 * draw_shape followed by derive_alpha.
 */
ShapeMasks rasterize_shape(ShapeKind kind, int radius, RandomSource& rng);

} // namespace drop_synth::shape
