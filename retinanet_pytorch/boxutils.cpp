#include "boxutils.h"

#include <sstream>
#include <stdexcept>

namespace {

std::string ShapeToString(at::IntArrayRef sizes) {
  std::stringstream str;
  str << sizes;
  return str.str();
}

void CheckBoxesShape(const at::Tensor& boxes, const char* name) {
  if (boxes.dim() != 3 || boxes.size(2) != 4)
    throw std::invalid_argument(std::string(name) +
                                " should have shape [B, N, 4], got " +
                                ShapeToString(boxes.sizes()));
}

}  // namespace

at::Tensor BBoxTransformInv(at::Tensor boxes,
                            at::Tensor deltas,
                            const std::vector<float>& mean,
                            const std::vector<float>& std_dev) {
  CheckBoxesShape(boxes, "Boxes");
  if (!boxes.sizes().equals(deltas.sizes()))
    throw std::invalid_argument("Shape mismatch between boxes " +
                                ShapeToString(boxes.sizes()) + " and deltas " +
                                ShapeToString(deltas.sizes()));
  if (mean.size() != 4 || std_dev.size() != 4)
    throw std::invalid_argument(
        "Regression mean and std should have 4 values each");

  boxes = boxes.to(kBoxDType);
  deltas = deltas.to(kBoxDType);

  auto width = boxes.select(2, 2) - boxes.select(2, 0);
  auto height = boxes.select(2, 3) - boxes.select(2, 1);

  auto x1 =
      boxes.select(2, 0) + (deltas.select(2, 0) * std_dev[0] + mean[0]) * width;
  auto y1 =
      boxes.select(2, 1) + (deltas.select(2, 1) * std_dev[1] + mean[1]) * height;
  auto x2 =
      boxes.select(2, 2) + (deltas.select(2, 2) * std_dev[2] + mean[2]) * width;
  auto y2 =
      boxes.select(2, 3) + (deltas.select(2, 3) * std_dev[3] + mean[3]) * height;

  return torch::stack({x1, y1, x2, y2}, /*dim*/ 2);
}

at::Tensor ClipBoxes(const std::vector<int64_t>& image_shape,
                     at::Tensor boxes,
                     ImageDataFormat format) {
  CheckBoxesShape(boxes, "Boxes");
  auto size = ImageSpatialSize(image_shape, format);
  auto max_y = static_cast<BoxScalar>(size.first - 1);
  auto max_x = static_cast<BoxScalar>(size.second - 1);

  boxes = boxes.to(kBoxDType);
  auto min_val = BoxScalar{0};
  return torch::stack({boxes.select(2, 0).clamp(min_val, max_x),
                       boxes.select(2, 1).clamp(min_val, max_y),
                       boxes.select(2, 2).clamp(min_val, max_x),
                       boxes.select(2, 3).clamp(min_val, max_y)},
                      /*dim*/ 2);
}
