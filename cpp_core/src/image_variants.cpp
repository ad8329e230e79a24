#include "image_variants.hpp"
#include "errors.hpp"
#include <opencv2/photo.hpp>
#include <filesystem>
#include <functional>
#include <iostream>
#include <system_error>
#include <utility>

namespace {
constexpr double CLAHE_CLIP_LIMIT = 3.0;
constexpr int CLAHE_TILES = 8;
constexpr int ADAPTIVE_BLOCK_SIZE = 11;
constexpr double ADAPTIVE_C = 2.0;
constexpr int CLOSE_KERNEL_SIZE = 2;
constexpr float DENOISE_STRENGTH = 10.0f;
constexpr int DENOISE_TEMPLATE_WINDOW = 10;
constexpr int DENOISE_SEARCH_WINDOW = 21;

using Transform = std::function<cv::Mat(const cv::Mat&)>;

cv::Mat Clahe(const cv::Mat& gray) {
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(CLAHE_CLIP_LIMIT, cv::Size(CLAHE_TILES, CLAHE_TILES));
    cv::Mat out;
    clahe->apply(gray, out);
    return out;
}

cv::Mat Otsu(const cv::Mat& gray) {
    cv::Mat out;
    cv::threshold(gray, out, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return out;
}

cv::Mat Adaptive(const cv::Mat& gray) {
    cv::Mat out;
    cv::adaptiveThreshold(gray, out, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY,
                          ADAPTIVE_BLOCK_SIZE, ADAPTIVE_C);
    return out;
}

cv::Mat MorphClose(const cv::Mat& gray) {
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(CLOSE_KERNEL_SIZE, CLOSE_KERNEL_SIZE));
    cv::Mat out;
    cv::morphologyEx(gray, out, cv::MORPH_CLOSE, kernel);
    return out;
}

cv::Mat Denoise(const cv::Mat& gray) {
    cv::Mat out;
    cv::fastNlMeansDenoising(gray, out, DENOISE_STRENGTH, DENOISE_TEMPLATE_WINDOW, DENOISE_SEARCH_WINDOW);
    return out;
}

cv::Mat Sharpen(const cv::Mat& gray) {
    cv::Mat kernel = (cv::Mat_<float>(3, 3) <<
        -1, -1, -1,
        -1,  9, -1,
        -1, -1, -1);
    cv::Mat out;
    cv::filter2D(gray, out, -1, kernel);
    return out;
}
}

cv::Mat VariantGenerator::ToGrayscale(const cv::Mat& image) {
    cv::Mat gray;
    switch (image.channels()) {
        case 1:
            gray = image.clone();
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw DecodeError("Unsupported channel count: " + std::to_string(image.channels()));
    }
    if (gray.depth() != CV_8U) {
        // 16-bit scans and float rasters are scaled into 8-bit for the thresholds.
        cv::normalize(gray, gray, 0, 255, cv::NORM_MINMAX, CV_8U);
    }
    return gray;
}

std::vector<ImageVariant> VariantGenerator::Generate(const cv::Mat& image) const {
    if (image.empty()) {
        throw DecodeError("Cannot build variants from an empty image");
    }

    cv::Mat gray = ToGrayscale(image);

    std::vector<ImageVariant> variants;
    variants.push_back({"grayscale", gray});

    const std::vector<std::pair<std::string, Transform>> transforms = {
        {"clahe", Clahe},
        {"otsu", Otsu},
        {"adaptive", Adaptive},
        {"morph_close", MorphClose},
        {"denoise", Denoise},
        {"sharpen", Sharpen},
    };

    for (const auto& [tag, transform] : transforms) {
        try {
            cv::Mat out = transform(gray);
            if (out.empty()) {
                std::cerr << "[Variants] " << tag << " produced no output, skipped" << std::endl;
                continue;
            }
            variants.push_back({tag, out});
        } catch (const cv::Exception& e) {
            std::cerr << "[Variants] " << tag << " failed, skipped: " << e.what() << std::endl;
        }
    }
    return variants;
}

cv::Mat LoadImage(const std::string& image_path) {
    std::error_code ec;
    bool exists = std::filesystem::exists(image_path, ec);
    if (ec) {
        throw NotFoundError("Cannot access " + image_path + ": " + ec.message());
    }
    if (!exists) {
        throw NotFoundError("File not found: " + image_path);
    }
    cv::Mat image = cv::imread(image_path, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw DecodeError("Failed to decode image at: " + image_path);
    }
    return image;
}
