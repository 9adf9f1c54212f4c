#include "anchors.h"
#include "imageutils.h"

#include <stdexcept>
#include <string>

at::Tensor GenerateAnchors(float base_size,
                           const std::vector<float>& ratios_vec,
                           const std::vector<float>& scales_vec) {
  if (base_size <= 0)
    throw std::invalid_argument("Anchor base size should be positive");
  if (ratios_vec.empty() || scales_vec.empty())
    throw std::invalid_argument("Anchor ratios and scales should not be empty");
  for (auto ratio : ratios_vec) {
    if (ratio <= 0)
      throw std::invalid_argument("Anchor ratios should be positive");
  }
  for (auto scale : scales_vec) {
    if (scale <= 0)
      throw std::invalid_argument("Anchor scales should be positive");
  }

  auto ratios = torch::tensor(ratios_vec, at::dtype(kBoxDType));
  auto scales = torch::tensor(scales_vec, at::dtype(kBoxDType));

  // Get all combinations of ratios and scales, scales vary fastest
  auto mesh = torch::meshgrid({ratios, scales});
  ratios = mesh[0].flatten();
  scales = mesh[1].flatten();

  // Keep the area of the scaled base box and change its aspect ratio
  auto sides = scales * base_size;
  auto areas = sides * sides;
  auto widths = torch::sqrt(areas / ratios);
  auto heights = widths * ratios;

  // Center boxes on the origin
  auto half_w = 0.5 * widths;
  auto half_h = 0.5 * heights;
  return torch::stack({-half_w, -half_h, half_w, half_h}, /*dim*/ 1)
      .to(kBoxDType);
}

at::Tensor Shift(const std::vector<int64_t>& image_shape,
                 const std::pair<int64_t, int64_t>& features_shape,
                 float stride,
                 at::Tensor anchors) {
  if (image_shape.size() < 2)
    throw std::invalid_argument("Image shape should have at least 2 dims");
  if (features_shape.first < 1 || features_shape.second < 1)
    throw std::invalid_argument("Feature map dimensions should be positive");
  if (stride <= 0)
    throw std::invalid_argument("Stride should be positive");
  if (anchors.dim() != 2 || anchors.size(1) != 4)
    throw std::invalid_argument("Anchors should have shape [A, 4]");
  if (anchors.size(0) == 0)
    throw std::invalid_argument("Anchors set is empty");

  auto height = image_shape[0];
  auto width = image_shape[1];
  auto feat_h = features_shape.first;
  auto feat_w = features_shape.second;

  // Center the anchors grid on the image
  auto offset_x =
      (static_cast<float>(width) - static_cast<float>(feat_w - 1) * stride) /
      2.f;
  auto offset_y =
      (static_cast<float>(height) - static_cast<float>(feat_h - 1) * stride) /
      2.f;

  auto options = at::dtype(kBoxDType).device(anchors.device());
  auto shifts_x = torch::arange(0, feat_w, options) * stride + offset_x;
  auto shifts_y = torch::arange(0, feat_h, options) * stride + offset_y;

  // mesh[k][i][j] corresponds to the cell at row i and column j
  auto mesh = torch::meshgrid({shifts_y, shifts_x});
  shifts_y = mesh[0].flatten();
  shifts_x = mesh[1].flatten();

  // Same shift for both corners, so the box is translated without resizing
  auto shifts =
      torch::stack({shifts_x, shifts_y, shifts_x, shifts_y}, /*dim*/ 1);

  // Number of base points = feat_h * feat_w
  auto k = shifts.size(0);
  auto a = anchors.size(0);

  auto shifted_anchors = anchors.to(kBoxDType).reshape({1, a, 4}) +
                         shifts.reshape({k, 1, 4});
  return shifted_anchors.reshape({k * a, 4});
}

std::vector<std::pair<int64_t, int64_t>> GuessShapes(
    const std::vector<int64_t>& image_shape,
    const std::vector<int32_t>& pyramid_levels) {
  if (image_shape.size() < 2)
    throw std::invalid_argument("Image shape should have at least 2 dims");

  std::vector<std::pair<int64_t, int64_t>> shapes;
  for (auto level : pyramid_levels) {
    if (level < 0 || level > 62)
      throw std::invalid_argument("Wrong pyramid level " +
                                  std::to_string(level));
    int64_t factor = int64_t{1} << level;
    shapes.emplace_back((image_shape[0] + factor - 1) / factor,
                        (image_shape[1] + factor - 1) / factor);
  }
  return shapes;
}

at::Tensor AnchorsForShape(const std::vector<int64_t>& image_shape,
                           const std::vector<int32_t>& pyramid_levels,
                           const AnchorParameters& params) {
  if (pyramid_levels.empty())
    throw std::invalid_argument("Pyramid levels should not be empty");
  if (params.sizes.size() != pyramid_levels.size() ||
      params.strides.size() != pyramid_levels.size())
    throw std::invalid_argument(
        "Anchor sizes and strides should be given for every pyramid level");

  auto feature_shapes = GuessShapes(image_shape, pyramid_levels);

  std::vector<at::Tensor> anchors;
  for (size_t i = 0; i < pyramid_levels.size(); ++i) {
    auto level_anchors =
        GenerateAnchors(params.sizes[i], params.ratios, params.scales);
    anchors.push_back(Shift(image_shape, feature_shapes[i], params.strides[i],
                            level_anchors));
  }
  return at::cat(anchors, /*dim*/ 0);
}
