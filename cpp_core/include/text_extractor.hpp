#pragma once
#include <opencv2/core.hpp>
#include <string>

/**
 * @class TextExtractor
 * @brief Text-extraction capability: raster + language hint in, UTF-8 text out.
 *
 * Implementations return an empty string for images they cannot read text
 * from and throw CapabilityCallFailure when the engine itself fails.
 * Extract may be called from several threads at once.
 */
class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    virtual std::string Extract(const cv::Mat& image, const std::string& language_hint) = 0;
    virtual std::string Name() const = 0;
};
