#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

struct ImageVariant {
    std::string tag;   // name of the transform that produced it
    cv::Mat image;
};

/**
 * @class VariantGenerator
 * @brief Builds the fixed, ordered set of preprocessed variants fed to OCR.
 *
 * Order: grayscale, clahe, otsu, adaptive, morph_close, denoise, sharpen.
 * Every transform reads the grayscale base, never another variant. A transform
 * that fails is skipped, so the result holds 1..7 variants.
 */
class VariantGenerator {
public:
    std::vector<ImageVariant> Generate(const cv::Mat& image) const;

    static cv::Mat ToGrayscale(const cv::Mat& image);
};

// Reads an image from disk. Throws NotFoundError or DecodeError.
cv::Mat LoadImage(const std::string& image_path);
