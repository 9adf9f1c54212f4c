#include <catch2/catch.hpp>

#include "../config.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>

TEST_CASE("Default config", "[config]") {
  Config config;
  CHECK_NOTHROW(config.Validate());
  REQUIRE(config.pyramid_levels == std::vector<int32_t>{3, 4, 5, 6, 7});
  REQUIRE(config.anchor_params.NumAnchors() == 9);
  REQUIRE(config.anchor_params.scales[1] == Approx(std::pow(2.0, 1.0 / 3.0)));
  REQUIRE(config.anchor_params.scales[2] == Approx(std::pow(2.0, 2.0 / 3.0)));
  REQUIRE(config.bbox_mean == std::vector<float>{0, 0, 0, 0});
  REQUIRE(config.bbox_std_dev == std::vector<float>{0.2f, 0.2f, 0.2f, 0.2f});
  REQUIRE(config.image_data_format == ImageDataFormat::ChannelsLast);
}

TEST_CASE("Parse config overrides", "[config]") {
  auto config = ParseConfigJson(R"({
    "pyramid_levels": [3, 4],
    "anchor_parameters": {
      "sizes": [16, 32],
      "strides": [8, 16],
      "ratios": [1],
      "scales": [1, 2]
    },
    "regression": {"mean": [0.1, 0, 0, 0], "std": [1, 1, 1, 1]},
    "image_data_format": "channels_first"
  })");
  REQUIRE(config.pyramid_levels == std::vector<int32_t>{3, 4});
  REQUIRE(config.anchor_params.sizes == std::vector<float>{16, 32});
  REQUIRE(config.anchor_params.strides == std::vector<float>{8, 16});
  REQUIRE(config.anchor_params.NumAnchors() == 2);
  REQUIRE(config.bbox_mean[0] == Approx(0.1));
  REQUIRE(config.bbox_std_dev == std::vector<float>{1, 1, 1, 1});
  REQUIRE(config.image_data_format == ImageDataFormat::ChannelsFirst);
}

TEST_CASE("Parse config keeps defaults", "[config]") {
  auto config =
      ParseConfigJson(R"({"regression": {"std": [0.1, 0.1, 0.2, 0.2]}})");
  Config defaults;
  REQUIRE(config.pyramid_levels == defaults.pyramid_levels);
  REQUIRE(config.anchor_params.sizes == defaults.anchor_params.sizes);
  REQUIRE(config.bbox_mean == defaults.bbox_mean);
  REQUIRE(config.bbox_std_dev[2] == Approx(0.2));

  CHECK_NOTHROW(ParseConfigJson("{}"));
}

TEST_CASE("Parse config errors", "[config]") {
  REQUIRE_THROWS_AS(ParseConfigJson("{\"pyramid_levels\": [3, 4"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(ParseConfigJson("[]"), std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"pyramid_levels": 3})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"pyramid_levels": [3.5]})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"anchor_parameters": [1]})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      ParseConfigJson(R"({"anchor_parameters": {"ratios": ["wide"]}})"),
      std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"regression": {"std": [1, 1]}})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"image_data_format": "nhwc"})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"image_data_format": 1})"),
                    std::invalid_argument);
  // sizes and strides should follow the number of levels
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"pyramid_levels": [3, 4, 5]})"),
                    std::invalid_argument);
}

TEST_CASE("Parse config rejects non-positive anchors", "[config]") {
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"anchor_parameters": )"
                                    R"({"sizes": [32, 64, 0, 256, 512]}})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(ParseConfigJson(R"({"anchor_parameters": )"
                                    R"({"strides": [8, 16, 32, -64, 128]}})"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      ParseConfigJson(R"({"anchor_parameters": {"ratios": [0.5, 0]}})"),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      ParseConfigJson(R"({"anchor_parameters": {"scales": [-1]}})"),
      std::invalid_argument);

  Config config;
  config.anchor_params.strides[0] = 0;
  REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
}

TEST_CASE("Load config file", "[config]") {
  std::string file_name = "retinanet_config_test.json";
  {
    std::ofstream file(file_name);
    file << R"({"pyramid_levels": [5], "anchor_parameters": )"
         << R"({"sizes": [128], "strides": [32]}})";
  }
  auto config = LoadConfigJson(file_name);
  std::remove(file_name.c_str());
  REQUIRE(config.pyramid_levels == std::vector<int32_t>{5});
  REQUIRE(config.anchor_params.sizes == std::vector<float>{128});

  REQUIRE_THROWS_AS(LoadConfigJson("missing_retinanet_config.json"),
                    std::runtime_error);
}
