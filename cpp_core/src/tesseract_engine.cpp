#include "tesseract_engine.hpp"
#include "errors.hpp"
#include <tesseract/ocrclass.h>
#include <iostream>
#include <utility>

TesseractEngine::TesseractEngine(const std::string& data_path, const std::string& default_language,
                                 size_t pool_size, int timeout_ms)
    : data_path_(data_path), default_language_(default_language), timeout_ms_(timeout_ms) {
    if (pool_size == 0) pool_size = 1;

    std::cout << "[Tesseract] Loading (" << default_language_ << ") x" << pool_size << " from: "
              << data_path_ << std::endl;
    for (size_t i = 0; i < pool_size; ++i) {
        auto handle = std::make_unique<Handle>();
        handle->api = std::make_unique<tesseract::TessBaseAPI>();
        Initialise(*handle, default_language_);
        idle_.push_back(std::move(handle));
    }
}

TesseractEngine::~TesseractEngine() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (auto& handle : idle_) {
        handle->api->End();
    }
}

void TesseractEngine::Initialise(Handle& handle, const std::string& language) {
    handle.language.clear();
    if (handle.api->Init(data_path_.c_str(), language.c_str(), tesseract::OEM_LSTM_ONLY)) {
        throw CapabilityUnavailable("Could not initialize tesseract with language: " + language);
    }
    handle.api->SetPageSegMode(tesseract::PSM_AUTO);
    handle.api->SetVariable("preserve_interword_spaces", "1");
    handle.language = language;
}

std::unique_ptr<TesseractEngine::Handle> TesseractEngine::Acquire() {
    std::unique_lock<std::mutex> lock(pool_mutex_);
    pool_cv_.wait(lock, [this]() { return !idle_.empty(); });
    std::unique_ptr<Handle> handle = std::move(idle_.back());
    idle_.pop_back();
    return handle;
}

void TesseractEngine::Release(std::unique_ptr<Handle> handle) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_.push_back(std::move(handle));
    }
    pool_cv_.notify_one();
}

std::string TesseractEngine::Recognise(Handle& handle, const cv::Mat& image, const std::string& language) {
    if (handle.language != language) {
        Initialise(handle, language);
    }

    cv::Mat input = image.isContinuous() ? image : image.clone();
    handle.api->SetImage(input.data, input.cols, input.rows,
                         static_cast<int>(input.elemSize()), static_cast<int>(input.step));

    tesseract::ETEXT_DESC monitor;
    monitor.cancel = nullptr;
    monitor.cancel_this = nullptr;
    monitor.set_deadline_msecs(timeout_ms_);

    bool failed = handle.api->Recognize(timeout_ms_ > 0 ? &monitor : nullptr) < 0;
    if (timeout_ms_ > 0 && monitor.deadline_exceeded()) {
        throw CapabilityCallFailure("Tesseract exceeded its " + std::to_string(timeout_ms_) + " ms deadline");
    }
    if (failed) {
        // Layout analysis found nothing recognisable; not an engine fault.
        return "";
    }

    std::unique_ptr<char[]> text(handle.api->GetUTF8Text());
    return text ? std::string(text.get()) : std::string();
}

std::string TesseractEngine::Extract(const cv::Mat& image, const std::string& language_hint) {
    if (image.empty()) return "";

    const std::string language = language_hint.empty() ? default_language_ : language_hint;
    std::unique_ptr<Handle> handle = Acquire();

    std::string text;
    try {
        text = Recognise(*handle, image, language);
    } catch (const CleanOcrError&) {
        handle->api->Clear();
        Release(std::move(handle));
        throw;
    } catch (const std::exception& e) {
        handle->api->Clear();
        Release(std::move(handle));
        throw CapabilityCallFailure(std::string("Tesseract call failed: ") + e.what());
    }

    handle->api->Clear();
    Release(std::move(handle));
    return text;
}
