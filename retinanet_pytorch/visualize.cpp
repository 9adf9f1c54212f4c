#include "visualize.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

struct PixelBox {
  int x1{0};
  int y1{0};
  int x2{0};
  int y2{0};
};

PixelBox ToPixelBox(at::Tensor box) {
  if (box.numel() != 4)
    throw std::invalid_argument("Box should have 4 coordinates");
  // truncate like an integer cast of every coordinate
  auto coords = box.flatten().to(at::kCPU).to(at::kInt);
  auto data = coords.accessor<int32_t, 1>();
  return PixelBox{data[0], data[1], data[2], data[3]};
}

void CheckBoxes(const at::Tensor& boxes) {
  if (boxes.dim() != 2 || boxes.size(1) != 4)
    throw std::invalid_argument("Boxes should have shape [N, 4]");
}

std::string LabelCaption(int64_t label, const LabelToName& label_to_name) {
  return label_to_name ? label_to_name(label) : std::to_string(label);
}

}  // namespace

cv::Mat LoadImage(const std::string path) {
  cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
  if (image.empty())
    throw std::runtime_error("Failed to load image " + path);
  return image;
}

std::vector<int64_t> ImageShape(const cv::Mat& image,
                                ImageDataFormat format) {
  auto rows = static_cast<int64_t>(image.rows);
  auto cols = static_cast<int64_t>(image.cols);
  auto channels = static_cast<int64_t>(image.channels());
  if (format == ImageDataFormat::ChannelsFirst)
    return {channels, rows, cols};
  return {rows, cols, channels};
}

cv::Scalar LabelColor(int64_t label) {
  if (label < 0) {
    std::cerr << "Label " << label << " has no color, using default.\n";
    return cv::Scalar(0, 255, 0);
  }
  // hue advances by the golden ratio with every label
  const double golden_ratio = 0.618033988749895;
  auto hue = std::fmod(static_cast<double>(label) * golden_ratio, 1.0);
  cv::Mat hsv(1, 1, CV_8UC3,
              cv::Scalar(static_cast<int>(hue * 180), 255, 255));
  cv::Mat bgr;
  cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
  auto pixel = bgr.at<cv::Vec3b>(0, 0);
  return cv::Scalar(pixel[0], pixel[1], pixel[2]);
}

void DrawBox(cv::Mat& image,
             at::Tensor box,
             const cv::Scalar& color,
             int thickness) {
  auto b = ToPixelBox(box);
  cv::rectangle(image, cv::Point(b.x1, b.y1), cv::Point(b.x2, b.y2), color,
                thickness, cv::LINE_AA);
}

void DrawCaption(cv::Mat& image, at::Tensor box, const std::string& caption) {
  auto b = ToPixelBox(box);
  cv::Point org(b.x1, b.y1 - 10);
  // black outline first, white text on top
  cv::putText(image, caption, org, cv::FONT_HERSHEY_PLAIN, 1,
              cv::Scalar(0, 0, 0), 2);
  cv::putText(image, caption, org, cv::FONT_HERSHEY_PLAIN, 1,
              cv::Scalar(255, 255, 255), 1);
}

void DrawBoxes(cv::Mat& image,
               at::Tensor boxes,
               const cv::Scalar& color,
               int thickness) {
  CheckBoxes(boxes);
  for (int64_t i = 0; i < boxes.size(0); ++i) {
    DrawBox(image, boxes[i], color, thickness);
  }
}

void DrawDetections(cv::Mat& image,
                    at::Tensor boxes,
                    at::Tensor scores,
                    at::Tensor labels,
                    const cv::Scalar* color,
                    const LabelToName& label_to_name,
                    float score_threshold) {
  CheckBoxes(boxes);
  auto n = boxes.size(0);
  if (scores.numel() != n || labels.numel() != n)
    throw std::invalid_argument(
        "Number of scores and labels should match number of boxes");

  auto scores_cpu = scores.flatten().to(at::kCPU).to(at::kFloat);
  auto labels_cpu = labels.flatten().to(at::kCPU).to(at::kLong);
  auto scores_data = scores_cpu.accessor<float, 1>();
  auto labels_data = labels_cpu.accessor<int64_t, 1>();

  for (int64_t i = 0; i < n; ++i) {
    auto score = scores_data[i];
    if (score <= score_threshold)
      continue;
    auto label = labels_data[i];
    auto box_color = color ? *color : LabelColor(label);
    DrawBox(image, boxes[i], box_color);

    std::stringstream caption;
    caption << LabelCaption(label, label_to_name) << ": " << std::fixed
            << std::setprecision(2) << score;
    DrawCaption(image, boxes[i], caption.str());
  }
}

void DrawAnnotations(cv::Mat& image,
                     at::Tensor boxes,
                     at::Tensor labels,
                     const cv::Scalar* color,
                     const LabelToName& label_to_name) {
  CheckBoxes(boxes);
  if (labels.numel() != boxes.size(0))
    throw std::invalid_argument(
        "Number of annotation labels should match number of boxes");

  auto labels_cpu = labels.flatten().to(at::kCPU).to(at::kLong);
  auto labels_data = labels_cpu.accessor<int64_t, 1>();
  for (int64_t i = 0; i < boxes.size(0); ++i) {
    auto label = labels_data[i];
    auto box_color = color ? *color : LabelColor(label);
    DrawCaption(image, boxes[i], LabelCaption(label, label_to_name));
    DrawBox(image, boxes[i], box_color);
  }
}
