#pragma once
#include "grammar_checker.hpp"
#include <memory>
#include <string>
#include <ort_genai.h>

/**
 * @class GenerativeGrammarChecker
 * @brief GrammarChecker that asks a local instruction-tuned model (Phi-3 family,
 * onnxruntime-genai format) to rewrite the text, then reports the word-level
 * differences as matches.
 */
class GenerativeGrammarChecker : public GrammarChecker {
public:
    GenerativeGrammarChecker(const std::string& model_dir, const std::string& language = "Russian",
                             long timeout_ms = 60000);

    std::vector<GrammarMatch> Check(const std::string& text) override;
    std::string Name() const override { return "generative"; }

private:
    std::string Rewrite(const std::string& text);

    std::unique_ptr<OgaModel> model_;
    std::unique_ptr<OgaTokenizer> tokenizer_;
    std::string language_;
    long timeout_ms_;
};
