#pragma once
#include "image_variants.hpp"
#include "text_extractor.hpp"
#include <string>
#include <vector>

struct RecognitionResult {
    std::string variant_tag;
    int variant_index = -1;       // -1 when no variant was attempted
    std::string extracted_text;   // trimmed
};

/**
 * @class RecognitionSelector
 * @brief Runs every variant through OCR and keeps the longest trimmed text.
 *
 * Ties go to the variant generated first. Up to `max_workers` variants are
 * recognized at a time; the winner does not depend on completion order.
 */
class RecognitionSelector {
public:
    explicit RecognitionSelector(TextExtractor& extractor, unsigned max_workers = 1);

    RecognitionResult Select(const std::vector<ImageVariant>& variants, const std::string& language_hint) const;

private:
    std::string Recognize(const ImageVariant& variant, const std::string& language_hint) const;

    TextExtractor& extractor_;
    unsigned max_workers_;
};
