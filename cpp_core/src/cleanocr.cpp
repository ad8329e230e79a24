#include "cleanocr.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

CleanOCR::CleanOCR(std::unique_ptr<TextExtractor> extractor,
                   std::unique_ptr<CorrectionPipeline> pipeline,
                   const std::string& language_hint,
                   unsigned recognition_workers)
    : extractor_(std::move(extractor)),
      pipeline_(std::move(pipeline)),
      language_hint_(language_hint),
      recognition_workers_(recognition_workers) {
    if (!extractor_) {
        throw std::invalid_argument("CleanOCR needs a text extractor");
    }
}

RecognitionResult CleanOCR::Recognize(const std::string& image_path) {
    std::cout << "[CleanOCR] Processing: " << image_path << std::endl;

    cv::Mat image = LoadImage(image_path);
    std::vector<ImageVariant> variants = variant_generator_.Generate(image);

    RecognitionSelector selector(*extractor_, recognition_workers_);
    RecognitionResult best = selector.Select(variants, language_hint_);
    std::cout << "[Selector] Best variant: " << best.variant_tag << std::endl;
    return best;
}

ProcessResult CleanOCR::Process(const std::string& image_path, const ProcessOptions& options) {
    ProcessResult result;

    RecognitionResult recognition;
    try {
        recognition = Recognize(image_path);
    } catch (const CleanOcrError& e) {
        std::cerr << "[CleanOCR] Error: " << e.what() << std::endl;
        result.error = e.what();
        return result;
    } catch (const cv::Exception& e) {
        std::cerr << "[CleanOCR] Error: " << e.what() << std::endl;
        result.error = std::string("Image processing failed: ") + e.what();
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[CleanOCR] Error: " << e.what() << std::endl;
        result.error = e.what();
        return result;
    }

    result.success = true;
    result.full_text = recognition.extracted_text;
    result.statistics = ComputeStatistics(result.full_text);
    result.best_variant = recognition.variant_tag;

    if (options.check_errors) {
        if (pipeline_) {
            CorrectionResult correction = pipeline_->Run(result.full_text);
            result.checked = true;
            result.errors = std::move(correction.issues);
            result.error_count = correction.issue_count;
            result.error_types = std::move(correction.counts_by_kind);
            result.corrected_text = std::move(correction.corrected_text);
        } else {
            std::cerr << "[CleanOCR] Correction requested but no pipeline is configured" << std::endl;
        }
    }
    return result;
}

TextStatistics ComputeStatistics(const std::string& text) {
    TextStatistics stats;
    stats.characters = TextUtils::CodePointCount(text);
    stats.words = TextUtils::CountWords(text);
    return stats;
}

std::string SaveResult(const std::string& text, const std::string& image_path, const std::string& output_dir) {
    std::filesystem::path out_path;
    if (output_dir.empty()) {
        out_path = std::filesystem::path(image_path).replace_extension(".txt");
    } else {
        std::filesystem::create_directories(output_dir);
        out_path = std::filesystem::path(output_dir) /
                   std::filesystem::path(image_path).filename().replace_extension(".txt");
    }

    std::ofstream ofs(out_path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open for writing: " + out_path.string());
    }
    ofs << text;
    if (!ofs) {
        throw std::runtime_error("Failed to write: " + out_path.string());
    }
    return out_path.string();
}
