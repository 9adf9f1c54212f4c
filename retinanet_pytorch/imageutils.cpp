#include "imageutils.h"

#include <stdexcept>

ImageDataFormat ParseImageDataFormat(const std::string& name) {
  if (name == "channels_first")
    return ImageDataFormat::ChannelsFirst;
  if (name == "channels_last")
    return ImageDataFormat::ChannelsLast;
  throw std::invalid_argument("Unknown image data format : " + name);
}

std::string ImageDataFormatName(ImageDataFormat format) {
  switch (format) {
    case ImageDataFormat::ChannelsFirst:
      return "channels_first";
    case ImageDataFormat::ChannelsLast:
      return "channels_last";
  }
  throw std::invalid_argument("Unknown image data format");
}

std::pair<int64_t, int64_t> ImageSpatialSize(
    const std::vector<int64_t>& image_shape,
    ImageDataFormat format) {
  bool channels_first = format == ImageDataFormat::ChannelsFirst;
  switch (image_shape.size()) {
    case 2:
      return {image_shape[0], image_shape[1]};
    case 3:
      if (channels_first)
        return {image_shape[1], image_shape[2]};
      return {image_shape[0], image_shape[1]};
    case 4:
      if (channels_first)
        return {image_shape[2], image_shape[3]};
      return {image_shape[1], image_shape[2]};
    default:
      throw std::invalid_argument(
          "Image shape should have 2, 3 or 4 dimensions, got " +
          std::to_string(image_shape.size()));
  }
}
