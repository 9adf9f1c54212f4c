#ifndef CONFIG_H
#define CONFIG_H

#include "anchors.h"
#include "imageutils.h"

#include <stdint.h>
#include <string>
#include <vector>

/* Detection post-processing configuration.
 * Defaults match the standard RetinaNet setup, any of the values can be
 * overridden from a JSON file with LoadConfigJson.
 */
class Config {
 public:
  Config() = default;

  // Throws std::invalid_argument if the values are inconsistent
  void Validate() const;

  // Feature pyramid levels the detection heads run on, level l has stride 2^l
  std::vector<int32_t> pyramid_levels = {3, 4, 5, 6, 7};

  // Sizes and strides are given per pyramid level
  AnchorParameters anchor_params;

  // Statistics used to normalize the regression targets during training
  std::vector<float> bbox_mean = {0, 0, 0, 0};
  std::vector<float> bbox_std_dev = {0.2f, 0.2f, 0.2f, 0.2f};

  // Axis order of the input image tensor
  ImageDataFormat image_data_format = ImageDataFormat::ChannelsLast;
};

/* Expected format, all keys are optional:
 * {
 *   "pyramid_levels": [3, 4, 5, 6, 7],
 *   "anchor_parameters": {
 *     "sizes": [32, 64, 128, 256, 512],
 *     "strides": [8, 16, 32, 64, 128],
 *     "ratios": [0.5, 1, 2],
 *     "scales": [1, 1.2599, 1.5874]
 *   },
 *   "regression": {"mean": [0, 0, 0, 0], "std": [0.2, 0.2, 0.2, 0.2]},
 *   "image_data_format": "channels_last"
 * }
 */
Config ParseConfigJson(const std::string& json);

Config LoadConfigJson(const std::string& file_name);

#endif  // CONFIG_H
