#ifndef BOXUTILS_H
#define BOXUTILS_H

#include "imageutils.h"

#include <torch/torch.h>

#include <stdint.h>
#include <vector>

/*
 * Applies deltas (usually regression results) to boxes (usually anchors).
 * Before applying the deltas to the boxes, the normalization that was
 * applied to the regression targets during training is removed.
 * boxes: [B, N, 4] where each row is x1, y1, x2, y2
 * deltas: [B, N, 4] where each row is dx1, dy1, dx2, dy2 as a factor of the
 *     box width/height
 * mean, std_dev: 4 values each, the statistics used to normalize the targets
 * Returns [B, N, 4] refined boxes. Inverted corners are not corrected.
 */
at::Tensor BBoxTransformInv(at::Tensor boxes,
                            at::Tensor deltas,
                            const std::vector<float>& mean = {0, 0, 0, 0},
                            const std::vector<float>& std_dev = {0.2f, 0.2f,
                                                                 0.2f, 0.2f});

/*
 * Clips boxes to lie inside the image.
 * image_shape: shape of the image tensor, height and width are picked
 *     according to format (see ImageSpatialSize)
 * boxes: [B, N, 4] each row is x1, y1, x2, y2
 * x coordinates are clamped to [0, width - 1], y coordinates to
 * [0, height - 1]. Coordinates are not reordered.
 */
at::Tensor ClipBoxes(const std::vector<int64_t>& image_shape,
                     at::Tensor boxes,
                     ImageDataFormat format = ImageDataFormat::ChannelsLast);

#endif  // BOXUTILS_H
