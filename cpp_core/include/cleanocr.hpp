#pragma once
#include "correction_pipeline.hpp"
#include "image_variants.hpp"
#include "recognition_selector.hpp"
#include "text_extractor.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct ProcessOptions {
    bool check_errors = true;
    bool save_output = false;  // honoured by the caller; Process itself writes nothing
};

struct TextStatistics {
    size_t characters = 0;  // code points
    size_t words = 0;       // whitespace-delimited tokens
};

struct ProcessResult {
    bool success = false;
    std::string error;
    std::string full_text;
    TextStatistics statistics;
    std::string best_variant;

    // Filled only when correction ran.
    bool checked = false;
    std::vector<CorrectionIssue> errors;
    size_t error_count = 0;
    std::map<IssueKind, size_t> error_types;
    std::string corrected_text;
};

/**
 * @class CleanOCR
 * @brief Image in, recognized text plus correction report out.
 *
 * Loads the image, builds the preprocessing variants, keeps the best OCR
 * result and optionally runs the correction pipeline over it.
 */
class CleanOCR {
public:
    CleanOCR(std::unique_ptr<TextExtractor> extractor,
             std::unique_ptr<CorrectionPipeline> pipeline,
             const std::string& language_hint = "rus+eng",
             unsigned recognition_workers = 1);

    // Throws NotFoundError or DecodeError.
    RecognitionResult Recognize(const std::string& image_path);
    // Never throws for per-image failures; they come back as success == false.
    ProcessResult Process(const std::string& image_path, const ProcessOptions& options = ProcessOptions{});

    CorrectionPipeline* Pipeline() { return pipeline_.get(); }

private:
    std::unique_ptr<TextExtractor> extractor_;
    std::unique_ptr<CorrectionPipeline> pipeline_;
    std::string language_hint_;
    unsigned recognition_workers_;
    VariantGenerator variant_generator_;
};

TextStatistics ComputeStatistics(const std::string& text);

// Writes `text` to <output_dir>/<image stem>.txt and returns that path.
std::string SaveResult(const std::string& text, const std::string& image_path, const std::string& output_dir);
