#ifndef IMAGEUTILS_H
#define IMAGEUTILS_H

#include <torch/torch.h>

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

// Single scalar type used for every box coordinate in the pipeline
using BoxScalar = float;
constexpr auto kBoxDType = at::kFloat;

/*
 * Order of the image tensor axes.
 * ChannelsLast : [batch, height, width, channels]
 * ChannelsFirst : [batch, channels, height, width]
 */
enum class ImageDataFormat { ChannelsFirst, ChannelsLast };

/*
 * Accepts "channels_first" or "channels_last", throws std::invalid_argument
 * for anything else.
 */
ImageDataFormat ParseImageDataFormat(const std::string& name);

std::string ImageDataFormatName(ImageDataFormat format);

/*
 * Returns (height, width) from the image shape.
 * rank 2: (height, width) for both formats
 * rank 3: (height, width, channels) or (channels, height, width)
 * rank 4: the rank 3 layouts with a leading batch axis
 */
std::pair<int64_t, int64_t> ImageSpatialSize(
    const std::vector<int64_t>& image_shape,
    ImageDataFormat format);

#endif  // IMAGEUTILS_H
