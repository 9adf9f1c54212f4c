#ifndef VISUALIZE_H
#define VISUALIZE_H

#include "imageutils.h"

#include <torch/torch.h>
#include <opencv2/opencv.hpp>

#include <functional>
#include <string>
#include <vector>

using LabelToName = std::function<std::string(int64_t)>;

cv::Mat LoadImage(const std::string path);

// [height, width, channels] or [channels, height, width] of a decoded image
std::vector<int64_t> ImageShape(
    const cv::Mat& image,
    ImageDataFormat format = ImageDataFormat::ChannelsLast);

// Distinct color for every label, the same label always gets the same color
cv::Scalar LabelColor(int64_t label);

/*
 * box: [4] (x1, y1, x2, y2), coordinates are truncated to pixels.
 */
void DrawBox(cv::Mat& image,
             at::Tensor box,
             const cv::Scalar& color,
             int thickness = 2);

// Caption is drawn 10 pixels above the top-left corner of the box
void DrawCaption(cv::Mat& image, at::Tensor box, const std::string& caption);

/*
 * boxes: [N, (x1, y1, x2, y2)]
 */
void DrawBoxes(cv::Mat& image,
               at::Tensor boxes,
               const cv::Scalar& color,
               int thickness = 2);

/*
 * Draws detections with a score above score_threshold.
 * boxes: [N, (x1, y1, x2, y2)]
 * scores: [N] classification scores
 * labels: [N] class ids
 * color: if empty, LabelColor of each detection is used
 * label_to_name: if empty, captions contain the numeric label
 */
void DrawDetections(cv::Mat& image,
                    at::Tensor boxes,
                    at::Tensor scores,
                    at::Tensor labels,
                    const cv::Scalar* color = nullptr,
                    const LabelToName& label_to_name = nullptr,
                    float score_threshold = 0.5f);

/*
 * Draws ground truth annotations.
 * boxes: [N, (x1, y1, x2, y2)]
 * labels: [N] class ids
 * color: if empty, LabelColor of each annotation is used
 */
void DrawAnnotations(cv::Mat& image,
                     at::Tensor boxes,
                     at::Tensor labels,
                     const cv::Scalar* color = nullptr,
                     const LabelToName& label_to_name = nullptr);

#endif  // VISUALIZE_H
