#include <catch2/catch.hpp>

#include "../boxutils.h"
#include "../config.h"
#include "../visualize.h"

#include <string>

namespace {
// lines are anti-aliased, so only check that something was drawn
bool IsDrawn(const cv::Mat& image, int x, int y) {
  auto pixel = image.at<cv::Vec3b>(y, x);
  return pixel[0] > 0 || pixel[1] > 0 || pixel[2] > 0;
}
}  // namespace

TEST_CASE("Label color", "[visualize]") {
  REQUIRE((LabelColor(3) == LabelColor(3)));
  REQUIRE((LabelColor(0) != LabelColor(1)));
  REQUIRE((LabelColor(1) != LabelColor(2)));
  REQUIRE((LabelColor(-1) == cv::Scalar(0, 255, 0)));
}

TEST_CASE("Draw box", "[visualize]") {
  cv::Mat image = cv::Mat::zeros(50, 50, CV_8UC3);
  cv::Scalar color(255, 0, 0);
  DrawBox(image, torch::tensor({10.7f, 10.2f, 40.f, 40.f}), color, 1);
  // coordinates are truncated
  REQUIRE(IsDrawn(image, 10, 25));
  REQUIRE(IsDrawn(image, 25, 10));
  REQUIRE(IsDrawn(image, 40, 25));
  REQUIRE(!IsDrawn(image, 25, 25));
  REQUIRE_THROWS_AS(DrawBox(image, torch::zeros({3}), color),
                    std::invalid_argument);
}

TEST_CASE("Draw boxes", "[visualize]") {
  cv::Mat image = cv::Mat::zeros(50, 50, CV_8UC3);
  cv::Scalar color(0, 0, 255);
  auto boxes = torch::tensor({5.f, 5.f, 20.f, 20.f, 30.f, 30.f, 45.f, 45.f})
                   .reshape({2, 4});
  DrawBoxes(image, boxes, color, 1);
  REQUIRE(IsDrawn(image, 5, 12));
  REQUIRE(IsDrawn(image, 30, 40));
  REQUIRE_THROWS_AS(DrawBoxes(image, torch::zeros({2, 5}), color),
                    std::invalid_argument);
}

TEST_CASE("Draw detections score threshold", "[visualize]") {
  cv::Mat image = cv::Mat::zeros(100, 100, CV_8UC3);
  auto boxes = torch::tensor({20.f, 20.f, 80.f, 80.f}).reshape({1, 4});
  auto labels = torch::tensor({int64_t{1}});

  DrawDetections(image, boxes, torch::tensor({0.5f}), labels);
  REQUIRE(cv::countNonZero(image.reshape(1)) == 0);

  cv::Scalar color(0, 255, 255);
  std::string caption_label;
  DrawDetections(image, boxes, torch::tensor({0.9f}), labels, &color,
                 [&](int64_t label) {
                   caption_label = "class_" + std::to_string(label);
                   return caption_label;
                 });
  REQUIRE(caption_label == "class_1");
  REQUIRE(IsDrawn(image, 20, 50));
  REQUIRE(cv::countNonZero(image.reshape(1)) > 0);

  REQUIRE_THROWS_AS(
      DrawDetections(image, boxes, torch::tensor({0.9f, 0.8f}), labels),
      std::invalid_argument);
}

TEST_CASE("Image shape follows data format", "[visualize]") {
  cv::Mat image = cv::Mat::zeros(40, 60, CV_8UC3);
  REQUIRE(ImageShape(image) == std::vector<int64_t>{40, 60, 3});

  auto config = ParseConfigJson(R"({"image_data_format": "channels_first"})");
  auto image_shape = ImageShape(image, config.image_data_format);
  REQUIRE(image_shape == std::vector<int64_t>{3, 40, 60});

  auto size = ImageSpatialSize(image_shape, config.image_data_format);
  REQUIRE(size.first == 40);
  REQUIRE(size.second == 60);

  auto boxes = torch::tensor({-5.f, -5.f, 100.f, 100.f}).reshape({1, 1, 4});
  auto clipped = ClipBoxes(image_shape, boxes, config.image_data_format);
  auto data = clipped.accessor<float, 3>();
  REQUIRE(data[0][0][0] == Approx(0));
  REQUIRE(data[0][0][1] == Approx(0));
  REQUIRE(data[0][0][2] == Approx(59));
  REQUIRE(data[0][0][3] == Approx(39));
}

TEST_CASE("Draw annotations", "[visualize]") {
  cv::Mat image = cv::Mat::zeros(100, 100, CV_8UC3);
  auto boxes = torch::tensor({20.f, 30.f, 80.f, 90.f}).reshape({1, 4});
  auto labels = torch::tensor({int64_t{7}});
  DrawAnnotations(image, boxes, labels);
  REQUIRE(IsDrawn(image, 50, 90));

  REQUIRE_THROWS_AS(
      DrawAnnotations(image, boxes, torch::tensor({int64_t{1}, int64_t{2}})),
      std::invalid_argument);
}

TEST_CASE("Draw annotations color", "[visualize]") {
  auto boxes = torch::tensor({10.f, 10.f, 40.f, 40.f}).reshape({1, 4});
  cv::Mat first = cv::Mat::zeros(50, 50, CV_8UC3);
  cv::Mat second = cv::Mat::zeros(50, 50, CV_8UC3);
  DrawAnnotations(first, boxes, torch::tensor({int64_t{1}}));
  DrawAnnotations(second, boxes, torch::tensor({int64_t{2}}));
  // box edge away from the caption and the anti-aliased corners
  auto first_pixel = first.at<cv::Vec3b>(25, 10);
  auto second_pixel = second.at<cv::Vec3b>(25, 10);
  REQUIRE((first_pixel != second_pixel));

  cv::Scalar green(0, 255, 0);
  cv::Mat fixed = cv::Mat::zeros(50, 50, CV_8UC3);
  DrawAnnotations(fixed, boxes, torch::tensor({int64_t{2}}), &green);
  auto pixel = fixed.at<cv::Vec3b>(25, 10);
  REQUIRE(pixel[0] == 0);
  REQUIRE(pixel[1] > 0);
  REQUIRE(pixel[2] == 0);
}
