#include "anchors.h"
#include "boxutils.h"
#include "config.h"
#include "imageutils.h"
#include "versioncheck.h"
#include "visualize.h"

#include <torch/torch.h>
#include <opencv2/opencv.hpp>

#include <algorithm>
#include <chrono>
#include <experimental/filesystem>
#include <iostream>
#include <vector>

namespace fs = std::experimental::filesystem;

const cv::String keys =
    "{help h usage ? |           | print this message   }"
    "{@image         |<none>     | path to image }"
    "{config         |           | path to JSON configuration }"
    "{level          |3          | pyramid level to draw anchors for }"
    "{output         |result.png | path to the output image }";

int main(int argc, char** argv) {
  try {
    cv::CommandLineParser parser(argc, argv, keys);
    parser.about("RetinaNet anchors demo");

    if (parser.has("help") || argc == 1) {
      parser.printMessage();
      return 0;
    }

    std::string image_path = parser.get<cv::String>(0);
    std::string config_path = parser.get<cv::String>("config");
    auto level = parser.get<int32_t>("level");
    std::string output_path = parser.get<cv::String>("output");

    // Check parsing errors
    if (!parser.check()) {
      parser.printErrors();
      parser.printMessage();
      return 1;
    }

    if (!CheckTorchVersion())
      return 1;

    if (!fs::exists(image_path))
      throw std::invalid_argument("Wrong file path for image");
    image_path = fs::canonical(image_path);

    Config config;
    if (!config_path.empty()) {
      if (!fs::exists(config_path))
        throw std::invalid_argument("Wrong file path for config");
      config = LoadConfigJson(fs::canonical(config_path));
    }

    auto level_pos = std::find(config.pyramid_levels.begin(),
                               config.pyramid_levels.end(), level);
    if (level_pos == config.pyramid_levels.end())
      throw std::invalid_argument("Pyramid level " + std::to_string(level) +
                                  " is not configured");
    auto level_index =
        static_cast<size_t>(level_pos - config.pyramid_levels.begin());

    auto format = config.image_data_format;
    std::cout << "Image data format " << ImageDataFormatName(format) << "\n";

    auto image = LoadImage(image_path);
    auto image_shape = ImageShape(image, format);
    auto spatial_size = ImageSpatialSize(image_shape, format);
    std::vector<int64_t> anchors_shape{spatial_size.first, spatial_size.second};

    auto start = std::chrono::steady_clock::now();

    auto anchors = AnchorsForShape(anchors_shape, config.pyramid_levels,
                                   config.anchor_params);
    // Network output stand-in, zero deltas keep the anchors in place
    auto batch_anchors = anchors.unsqueeze(0);
    auto deltas = torch::zeros_like(batch_anchors);
    auto boxes = BBoxTransformInv(batch_anchors, deltas, config.bbox_mean,
                                  config.bbox_std_dev);
    boxes = ClipBoxes(image_shape, boxes, format);

    auto stop = std::chrono::steady_clock::now();
    auto process_time =
        std::chrono::duration_cast<std::chrono::milliseconds>(stop - start)
            .count();

    auto feature_shapes =
        GuessShapes(anchors_shape, config.pyramid_levels);
    auto num_anchors = config.anchor_params.NumAnchors();
    int64_t level_offset = 0;
    int64_t level_start = 0;
    for (size_t i = 0; i < feature_shapes.size(); ++i) {
      auto& shape = feature_shapes[i];
      auto count = shape.first * shape.second * num_anchors;
      std::cout << "Level " << config.pyramid_levels[i] << " : "
                << shape.first << "x" << shape.second << " cells, " << count
                << " anchors\n";
      if (i == level_index)
        level_start = level_offset;
      level_offset += count;
    }
    std::cout << "Total anchors " << anchors.size(0) << "\n";
    std::cout << "Processing time " << process_time << "\n";

    // Anchors of the cell nearest to the image center
    auto& shape = feature_shapes[level_index];
    auto center_cell = (shape.first / 2) * shape.second + shape.second / 2;
    auto cell_boxes =
        boxes[0].narrow(0, level_start + center_cell * num_anchors, num_anchors);

    cv::Mat result = image.clone();
    DrawBoxes(result, cell_boxes, LabelColor(level));
    if (!cv::imwrite(output_path, result))
      throw std::runtime_error("Failed to write " + output_path);
    std::cout << "Result saved to " << output_path << "\n";
  } catch (const std::exception& err) {
    std::cerr << err.what() << std::endl;
    return 1;
  }
  return 0;
}
