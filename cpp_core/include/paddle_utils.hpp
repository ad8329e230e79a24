#pragma once
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Stateless pre/post-processing for the PaddleOCR detection and recognition models.
namespace PaddleUtils {
    using Quad = std::vector<cv::Point>;

    struct TextLine {
        Quad box;
        std::string text;
    };

    // Resizes so the long side is at most max_side and both sides are multiples of 32.
    std::pair<cv::Mat, float> ResizeForDetection(const cv::Mat& bgr, int max_side = 960);
    cv::Mat NormalizeImageNet(const cv::Mat& bgr);
    std::vector<Quad> PostprocessDetection(const float* prob_map, const cv::Size& original_shape,
                                           const cv::Size& resized_shape, float scale);
    // Top-to-bottom lines, left-to-right within a line.
    void SortReadingOrder(std::vector<Quad>& boxes);
    cv::Mat WarpQuad(const cv::Mat& bgr, const Quad& quad);
    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width = 320, int overlap = 64);
    cv::Mat PreprocessRecognition(const cv::Mat& crop);
    // Greedy CTC decode; charset[0] is the blank token.
    std::string DecodeCtc(const float* preds, const std::vector<int64_t>& preds_shape,
                          const std::vector<std::string>& charset);
    std::string JoinLines(const std::vector<TextLine>& lines);
}
