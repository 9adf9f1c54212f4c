#ifndef ANCHORS_H
#define ANCHORS_H

#include <torch/torch.h>

#include <stdint.h>
#include <utility>
#include <vector>

/*
 * Parameters which define how anchors are generated.
 *   sizes: base size of the anchors at each pyramid level, in pixels.
 *   strides: stride of each pyramid level relative to the image, in pixels.
 *   ratios: ratios of anchors at each cell (height/width).
 *   scales: scales of anchors at each cell, multiply the base size.
 */
struct AnchorParameters {
  std::vector<float> sizes = {32, 64, 128, 256, 512};
  std::vector<float> strides = {8, 16, 32, 64, 128};
  std::vector<float> ratios = {0.5f, 1.f, 2.f};
  std::vector<float> scales = {1.f, 1.25992105f, 1.58740105f};  // 2^(i/3)

  int64_t NumAnchors() const {
    return static_cast<int64_t>(ratios.size() * scales.size());
  }
};

/*
 * Generate reference anchors for one pyramid level by enumerating
 * ratios and scales of a base box centered on the origin.
 * Returns:
 * anchors: [ratios * scales, (x1, y1, x2, y2)]. All scales of ratios[0]
 *     come first, then all scales of ratios[1], and so on.
 */
at::Tensor GenerateAnchors(float base_size,
                           const std::vector<float>& ratios,
                           const std::vector<float>& scales);

/*
 * Produce shifted anchors based on shape of the image, shape of the feature
 * map and stride.
 *   image_shape: [height, width, ...] of the input image.
 *   features_shape: (height, width) of the feature map.
 *   stride: stride to shift the anchors with over the feature map.
 *   anchors: [A, 4] the anchors to apply at each location.
 * Returns:
 * anchors: [height * width * A, (x1, y1, x2, y2)]. Feature map cells in
 *     row-major order, all A anchors of a cell are adjacent.
 */
at::Tensor Shift(const std::vector<int64_t>& image_shape,
                 const std::pair<int64_t, int64_t>& features_shape,
                 float stride,
                 at::Tensor anchors);

/*
 * Guess shapes of the feature maps at each pyramid level based on the image
 * shape: level l is the image downsampled by 2^l with rounding up.
 */
std::vector<std::pair<int64_t, int64_t>> GuessShapes(
    const std::vector<int64_t>& image_shape,
    const std::vector<int32_t>& pyramid_levels);

/*
 * Generate anchors for all pyramid levels of the given image shape.
 * Returns:
 * anchors: [N, (x1, y1, x2, y2)]. Anchors of pyramid_levels[0] come first,
 *     then anchors of pyramid_levels[1], and so on.
 */
at::Tensor AnchorsForShape(const std::vector<int64_t>& image_shape,
                           const std::vector<int32_t>& pyramid_levels,
                           const AnchorParameters& params);

#endif  // ANCHORS_H
