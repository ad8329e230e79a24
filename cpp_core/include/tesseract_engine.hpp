#pragma once
#include "text_extractor.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <tesseract/baseapi.h>

/**
 * @class TesseractEngine
 * @brief LSTM Tesseract behind the TextExtractor interface.
 *
 * TessBaseAPI is not thread-safe, so the engine keeps a pool of handles and
 * lends one to each Extract call. A handle is re-initialised when the call
 * asks for a different language set than it was loaded with.
 */
class TesseractEngine : public TextExtractor {
public:
    TesseractEngine(const std::string& data_path, const std::string& default_language,
                    size_t pool_size = 1, int timeout_ms = 0);
    ~TesseractEngine() override;

    std::string Extract(const cv::Mat& image, const std::string& language_hint) override;
    std::string Name() const override { return "tesseract"; }

private:
    struct Handle {
        std::unique_ptr<tesseract::TessBaseAPI> api;
        std::string language;
    };

    std::unique_ptr<Handle> Acquire();
    void Release(std::unique_ptr<Handle> handle);
    void Initialise(Handle& handle, const std::string& language);
    std::string Recognise(Handle& handle, const cv::Mat& image, const std::string& language);

    std::string data_path_;
    std::string default_language_;
    int timeout_ms_;

    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<std::unique_ptr<Handle>> idle_;
};
