#include "recognition_selector.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <future>
#include <iostream>

RecognitionSelector::RecognitionSelector(TextExtractor& extractor, unsigned max_workers)
    : extractor_(extractor), max_workers_(std::max(1u, max_workers)) {}

std::string RecognitionSelector::Recognize(const ImageVariant& variant, const std::string& language_hint) const {
    try {
        return TextUtils::Trim(extractor_.Extract(variant.image, language_hint));
    } catch (const std::exception& e) {
        std::cerr << "[Selector] " << extractor_.Name() << " failed on variant '" << variant.tag
                  << "', counted as empty: " << e.what() << std::endl;
        return "";
    }
}

RecognitionResult RecognitionSelector::Select(const std::vector<ImageVariant>& variants,
                                              const std::string& language_hint) const {
    std::vector<std::string> texts(variants.size());

    if (max_workers_ == 1) {
        for (size_t i = 0; i < variants.size(); ++i) {
            texts[i] = Recognize(variants[i], language_hint);
        }
    } else {
        // Recognize in waves of at most max_workers_ concurrent tasks.
        for (size_t wave = 0; wave < variants.size(); wave += max_workers_) {
            size_t wave_end = std::min(variants.size(), wave + max_workers_);
            std::vector<std::future<std::string>> futures;
            for (size_t i = wave; i < wave_end; ++i) {
                futures.push_back(std::async(std::launch::async, [this, &variants, &language_hint, i]() {
                    return Recognize(variants[i], language_hint);
                }));
            }
            for (size_t i = wave; i < wave_end; ++i) {
                texts[i] = futures[i - wave].get();
            }
        }
    }

    RecognitionResult best;
    size_t best_length = 0;
    for (size_t i = 0; i < variants.size(); ++i) {
        size_t length = TextUtils::CodePointCount(texts[i]);
        std::cout << "[Selector] " << variants[i].tag << ": " << length << " chars" << std::endl;
        if (best.variant_index < 0 || length > best_length) {
            best.variant_tag = variants[i].tag;
            best.variant_index = static_cast<int>(i);
            best.extracted_text = texts[i];
            best_length = length;
        }
    }
    return best;
}
