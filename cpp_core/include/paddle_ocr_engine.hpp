#pragma once
#include "paddle_utils.hpp"
#include "text_extractor.hpp"
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>

/**
 * @class PaddleOcrEngine
 * @brief PaddleOCR detection + recognition models behind the TextExtractor interface.
 *
 * The recognizer is multilingual, so the language hint is not used to pick a
 * model. Session::Run is thread-safe; one engine serves all workers.
 */
class PaddleOcrEngine : public TextExtractor {
public:
    PaddleOcrEngine(const std::string& models_dir, int intra_op_threads = 0);

    std::string Extract(const cv::Mat& image, const std::string& language_hint) override;
    std::string Name() const override { return "paddle"; }

    std::vector<PaddleUtils::TextLine> ExtractLines(const cv::Mat& bgr);

private:
    void LoadCharset(const std::string& path);
    std::string RecognizeCrop(const cv::Mat& crop);

    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::unique_ptr<Ort::Session> det_session_;
    std::unique_ptr<Ort::Session> rec_session_;

    std::vector<std::string> det_input_names_str_;
    std::vector<std::string> det_output_names_str_;
    std::vector<const char*> det_input_names_;
    std::vector<const char*> det_output_names_;

    std::vector<std::string> rec_input_names_str_;
    std::vector<std::string> rec_output_names_str_;
    std::vector<const char*> rec_input_names_;
    std::vector<const char*> rec_output_names_;

    std::vector<std::string> charset_;
};
