#include "paddle_ocr_engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

namespace {
const char* DET_MODEL = "/ocr_detection_multilingual/inference.onnx";
const char* REC_MODEL = "/ocr_recognition_multilingual/inference.onnx";
const char* REC_DICT = "/ocr_recognition_multilingual/ppocrv5_dict.txt";
}

PaddleOcrEngine::PaddleOcrEngine(const std::string& models_dir, int intra_op_threads)
    : env_(ORT_LOGGING_LEVEL_WARNING, "cleanocr-paddle") {
    if (intra_op_threads <= 0) {
        int num_cores = static_cast<int>(std::thread::hardware_concurrency());
        if (num_cores == 0) num_cores = 4;
        intra_op_threads = std::max(1, num_cores / 2);
    }
    session_options_.SetIntraOpNumThreads(intra_op_threads);
    session_options_.SetInterOpNumThreads(1);

    Ort::AllocatorWithDefaultOptions allocator;
    try {
        std::cout << "[Paddle] Loading detection model..." << std::endl;
        std::string det_path = models_dir + DET_MODEL;
        det_session_ = std::make_unique<Ort::Session>(env_, det_path.c_str(), session_options_);

        std::cout << "[Paddle] Loading recognition model..." << std::endl;
        std::string rec_path = models_dir + REC_MODEL;
        rec_session_ = std::make_unique<Ort::Session>(env_, rec_path.c_str(), session_options_);
    } catch (const Ort::Exception& e) {
        throw CapabilityUnavailable(std::string("PaddleOCR models could not be loaded: ") + e.what());
    }

    det_input_names_str_.push_back(det_session_->GetInputNameAllocated(0, allocator).get());
    det_output_names_str_.push_back(det_session_->GetOutputNameAllocated(0, allocator).get());
    det_input_names_.push_back(det_input_names_str_[0].c_str());
    det_output_names_.push_back(det_output_names_str_[0].c_str());

    rec_input_names_str_.push_back(rec_session_->GetInputNameAllocated(0, allocator).get());
    rec_output_names_str_.push_back(rec_session_->GetOutputNameAllocated(0, allocator).get());
    rec_input_names_.push_back(rec_input_names_str_[0].c_str());
    rec_output_names_.push_back(rec_output_names_str_[0].c_str());

    LoadCharset(models_dir + REC_DICT);
}

void PaddleOcrEngine::LoadCharset(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CapabilityUnavailable("Could not open charset file: " + path);
    }

    charset_.clear();
    charset_.push_back("");  // CTC blank

    std::string line;
    while (std::getline(file, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (!line.empty()) {
            charset_.push_back(line);
        }
    }

    charset_.push_back(" ");  // models are exported with use_space_char
    std::cout << "[Paddle] Loaded charset with " << charset_.size() << " characters." << std::endl;
}

std::string PaddleOcrEngine::RecognizeCrop(const cv::Mat& crop) {
    auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::string text;
    for (const auto& chunk : PaddleUtils::SplitWideCrop(crop)) {
        cv::Mat blob = PaddleUtils::PreprocessRecognition(chunk);
        if (blob.empty()) continue;

        std::vector<int64_t> dims = {1, 3, blob.size[2], blob.size[3]};
        Ort::Value input = Ort::Value::CreateTensor<float>(
            memory_info, blob.ptr<float>(), blob.total(), dims.data(), dims.size());

        auto outputs = rec_session_->Run(
            Ort::RunOptions{nullptr}, rec_input_names_.data(), &input, 1, rec_output_names_.data(), 1);

        const float* preds = outputs[0].GetTensorData<float>();
        auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        std::string piece = PaddleUtils::DecodeCtc(preds, shape, charset_);
        if (piece.empty()) continue;
        if (!text.empty()) text += " ";
        text += piece;
    }
    return text;
}

std::vector<PaddleUtils::TextLine> PaddleOcrEngine::ExtractLines(const cv::Mat& bgr) {
    auto [resized, scale] = PaddleUtils::ResizeForDetection(bgr);
    cv::Mat blob = PaddleUtils::NormalizeImageNet(resized);

    auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    std::vector<int64_t> det_dims = {1, 3, resized.rows, resized.cols};
    Ort::Value input = Ort::Value::CreateTensor<float>(
        memory_info, blob.ptr<float>(), blob.total(), det_dims.data(), det_dims.size());

    auto det_outputs = det_session_->Run(
        Ort::RunOptions{nullptr}, det_input_names_.data(), &input, 1, det_output_names_.data(), 1);

    const float* prob_map = det_outputs[0].GetTensorData<float>();
    std::vector<PaddleUtils::Quad> boxes =
        PaddleUtils::PostprocessDetection(prob_map, bgr.size(), resized.size(), scale);

    std::vector<PaddleUtils::TextLine> lines;
    for (const auto& box : boxes) {
        cv::Mat crop = PaddleUtils::WarpQuad(bgr, box);
        if (crop.empty()) continue;
        lines.push_back({box, RecognizeCrop(crop)});
    }
    return lines;
}

std::string PaddleOcrEngine::Extract(const cv::Mat& image, const std::string& /*language_hint*/) {
    if (image.empty()) return "";

    cv::Mat bgr;
    if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = image;
    }

    try {
        return PaddleUtils::JoinLines(ExtractLines(bgr));
    } catch (const Ort::Exception& e) {
        throw CapabilityCallFailure(std::string("PaddleOCR inference failed: ") + e.what());
    } catch (const cv::Exception& e) {
        // Degenerate geometry in a malformed but decodable image.
        std::cerr << "[Paddle] " << e.what() << std::endl;
        return "";
    }
}
