#include "paddle_utils.hpp"
#include <clipper2/clipper.h>
#include <algorithm>
#include <cmath>

namespace {
constexpr float BINARY_THRESHOLD = 0.3f;
constexpr float BOX_SCORE_THRESHOLD = 0.6f;
constexpr float UNCLIP_RATIO = 1.5f;
constexpr double MIN_BOX_AREA = 80.0;
constexpr int REC_HEIGHT = 48;
constexpr int REC_WIDTH = 320;

double PathPerimeter(const Clipper2Lib::Path64& path) {
    if (path.size() < 2) return 0.0;
    double perimeter = 0.0;
    for (size_t i = 0; i < path.size(); ++i) {
        const auto& a = path[i];
        const auto& b = path[(i + 1) % path.size()];
        perimeter += std::hypot(static_cast<double>(b.x - a.x), static_cast<double>(b.y - a.y));
    }
    return perimeter;
}

std::vector<cv::Point2f> QuadFromContour(const std::vector<cv::Point>& contour) {
    cv::RotatedRect rect = cv::minAreaRect(contour);
    cv::Point2f points[4];
    rect.points(points);
    return {points[0], points[1], points[2], points[3]};
}

// Grows the detected kernel back to the full text region (DB post-processing).
std::vector<cv::Point2f> Unclip(const std::vector<cv::Point2f>& box, float ratio) {
    Clipper2Lib::Path64 path;
    for (const auto& p : box) {
        path.push_back(Clipper2Lib::Point64(static_cast<int64_t>(p.x), static_cast<int64_t>(p.y)));
    }

    double area = std::abs(Clipper2Lib::Area(path));
    double length = PathPerimeter(path);
    if (length == 0) return box;

    Clipper2Lib::Paths64 solution;
    Clipper2Lib::ClipperOffset offset;
    offset.AddPath(path, Clipper2Lib::JoinType::Round, Clipper2Lib::EndType::Polygon);
    offset.Execute(area * ratio / length, solution);
    if (solution.empty() || solution[0].empty()) return box;

    std::vector<cv::Point> contour;
    for (const auto& p : solution[0]) {
        contour.emplace_back(static_cast<int>(p.x), static_cast<int>(p.y));
    }
    return QuadFromContour(contour);
}

float BoxScore(const cv::Mat& prob_map, const std::vector<cv::Point2f>& box) {
    std::vector<cv::Point> int_box;
    for (const auto& p : box) int_box.emplace_back(static_cast<int>(p.x), static_cast<int>(p.y));

    cv::Mat mask = cv::Mat::zeros(prob_map.rows, prob_map.cols, CV_8U);
    cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{int_box}, 1);
    return static_cast<float>(cv::mean(prob_map, mask)[0]);
}
}

namespace PaddleUtils {

    std::pair<cv::Mat, float> ResizeForDetection(const cv::Mat& bgr, int max_side) {
        float scale = 1.0f;
        int long_side = std::max(bgr.rows, bgr.cols);
        if (long_side > max_side) {
            scale = static_cast<float>(max_side) / static_cast<float>(long_side);
        }

        auto round_up_32 = [](int v) { return std::max(32, (v + 31) / 32 * 32); };
        int new_h = round_up_32(static_cast<int>(bgr.rows * scale));
        int new_w = round_up_32(static_cast<int>(bgr.cols * scale));

        cv::Mat resized;
        cv::resize(bgr, resized, cv::Size(new_w, new_h));
        return {resized, scale};
    }

    cv::Mat NormalizeImageNet(const cv::Mat& bgr) {
        cv::Mat float_img;
        bgr.convertTo(float_img, CV_32F, 1.0 / 255.0);
        cv::subtract(float_img, cv::Scalar(0.485, 0.456, 0.406), float_img);
        cv::divide(float_img, cv::Scalar(0.229, 0.224, 0.225), float_img);
        return cv::dnn::blobFromImage(float_img);
    }

    std::vector<Quad> PostprocessDetection(const float* prob_map, const cv::Size& original_shape,
                                           const cv::Size& resized_shape, float scale) {
        cv::Mat prob_mat(resized_shape.height, resized_shape.width, CV_32F, const_cast<float*>(prob_map));
        cv::Mat bitmap = prob_mat > BINARY_THRESHOLD;

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

        // The detector input was padded up to a multiple of 32, so map back per axis.
        const float sx = static_cast<float>(resized_shape.width) / std::max(1.0f, original_shape.width * scale);
        const float sy = static_cast<float>(resized_shape.height) / std::max(1.0f, original_shape.height * scale);

        std::vector<Quad> boxes;
        for (const auto& contour : contours) {
            if (contour.size() < 4) continue;

            std::vector<cv::Point2f> box = QuadFromContour(contour);
            if (BoxScore(prob_mat, box) < BOX_SCORE_THRESHOLD) continue;

            Quad quad;
            for (auto p : Unclip(box, UNCLIP_RATIO)) {
                p.x = std::clamp(p.x / sx / scale, 0.0f, static_cast<float>(original_shape.width - 1));
                p.y = std::clamp(p.y / sy / scale, 0.0f, static_cast<float>(original_shape.height - 1));
                quad.emplace_back(static_cast<int>(p.x), static_cast<int>(p.y));
            }
            if (cv::contourArea(quad) < MIN_BOX_AREA) continue;
            boxes.push_back(quad);
        }
        SortReadingOrder(boxes);
        return boxes;
    }

    void SortReadingOrder(std::vector<Quad>& boxes) {
        auto top_left = [](const Quad& q) {
            cv::Rect r = cv::boundingRect(q);
            return std::make_pair(r.y, r.x);
        };
        std::sort(boxes.begin(), boxes.end(), [&](const Quad& a, const Quad& b) {
            return top_left(a) < top_left(b);
        });

        // Boxes whose tops are within 10 px sit on the same line: order them by x.
        for (size_t i = 1; i < boxes.size(); ++i) {
            for (size_t j = i; j > 0; --j) {
                auto a = top_left(boxes[j - 1]);
                auto b = top_left(boxes[j]);
                if (std::abs(a.first - b.first) < 10 && b.second < a.second) {
                    std::swap(boxes[j - 1], boxes[j]);
                } else {
                    break;
                }
            }
        }
    }

    cv::Mat WarpQuad(const cv::Mat& bgr, const Quad& quad) {
        if (quad.size() != 4) return cv::Mat();
        std::vector<cv::Point2f> src;
        for (const auto& p : quad) src.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));

        float w = static_cast<float>(std::max(cv::norm(src[0] - src[1]), cv::norm(src[2] - src[3])));
        float h = static_cast<float>(std::max(cv::norm(src[0] - src[3]), cv::norm(src[1] - src[2])));
        if (w < 1.0f || h < 1.0f) return cv::Mat();

        std::vector<cv::Point2f> dst = {{0, 0}, {w, 0}, {w, h}, {0, h}};
        cv::Mat transform = cv::getPerspectiveTransform(src, dst);

        cv::Mat crop;
        cv::warpPerspective(bgr, crop, transform, cv::Size(static_cast<int>(w), static_cast<int>(h)),
                            cv::INTER_CUBIC, cv::BORDER_REPLICATE);

        // Tall crops are vertical text lines.
        if (static_cast<float>(crop.rows) / crop.cols >= 1.5f) {
            cv::rotate(crop, crop, cv::ROTATE_90_COUNTERCLOCKWISE);
        }
        return crop;
    }

    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width, int overlap) {
        // Chunk width is measured after scaling to the recognizer height.
        const int scaled_width = static_cast<int>(std::ceil(crop.cols * static_cast<float>(REC_HEIGHT) / crop.rows));
        if (scaled_width <= chunk_width) return {crop};

        const int source_chunk = std::max(1, crop.cols * chunk_width / scaled_width);
        const int source_step = std::max(1, crop.cols * (chunk_width - overlap) / scaled_width);

        std::vector<cv::Mat> chunks;
        for (int start = 0; start < crop.cols; start += source_step) {
            int end = std::min(start + source_chunk, crop.cols);
            chunks.push_back(crop(cv::Rect(start, 0, end - start, crop.rows)).clone());
            if (end == crop.cols) break;
        }
        return chunks;
    }

    cv::Mat PreprocessRecognition(const cv::Mat& crop) {
        if (crop.empty()) return cv::Mat();

        cv::Mat src = crop;
        if (src.channels() == 1) cv::cvtColor(src, src, cv::COLOR_GRAY2BGR);

        const float ratio = static_cast<float>(src.cols) / static_cast<float>(src.rows);
        int resized_w = std::min(REC_WIDTH, static_cast<int>(std::ceil(REC_HEIGHT * ratio)));
        if (resized_w <= 0) return cv::Mat();

        cv::Mat resized;
        cv::resize(src, resized, cv::Size(resized_w, REC_HEIGHT), 0, 0, cv::INTER_LINEAR);

        // PaddleOCR recognizer input: (x / 255 - 0.5) / 0.5, right-padded with zeros.
        cv::Mat norm_img;
        resized.convertTo(norm_img, CV_32FC3, 2.0 / 255.0, -1.0);

        cv::Mat padded = cv::Mat::zeros(REC_HEIGHT, REC_WIDTH, CV_32FC3);
        norm_img.copyTo(padded(cv::Rect(0, 0, resized_w, REC_HEIGHT)));

        return cv::dnn::blobFromImage(padded, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
    }

    std::string DecodeCtc(const float* preds, const std::vector<int64_t>& preds_shape,
                          const std::vector<std::string>& charset) {
        if (preds_shape.size() != 3) return "";
        const int64_t steps = preds_shape[1];
        const int64_t classes = preds_shape[2];

        std::string text;
        int64_t last = 0;
        for (int64_t t = 0; t < steps; ++t) {
            const float* row = preds + t * classes;
            int64_t best = std::max_element(row, row + classes) - row;
            if (best != 0 && best != last && best < static_cast<int64_t>(charset.size())) {
                text += charset[best];
            }
            last = best;
        }
        return text;
    }

    std::string JoinLines(const std::vector<TextLine>& lines) {
        std::string out;
        for (const auto& line : lines) {
            if (line.text.find_first_not_of(' ') == std::string::npos) continue;
            if (!out.empty()) out += "\n";
            out += line.text;
        }
        return out;
    }
}
