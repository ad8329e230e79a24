#include "generative_grammar_checker.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

namespace {
constexpr size_t HARD_CONTEXT_CAP = 4096;
constexpr size_t SAFETY_MARGIN = 64;
constexpr double DEFAULT_TEMPERATURE = 0.0;
constexpr size_t MAX_INPUT_CHARS = 6000;
}

GenerativeGrammarChecker::GenerativeGrammarChecker(const std::string& model_dir, const std::string& language,
                                                   long timeout_ms)
    : language_(language), timeout_ms_(timeout_ms) {
    std::cout << "[Grammar] Loading model from: " << model_dir << std::endl;
    try {
        model_ = OgaModel::Create(model_dir.c_str());
        tokenizer_ = OgaTokenizer::Create(*model_);
    } catch (const std::exception& e) {
        throw CapabilityUnavailable(std::string("Grammar model could not be loaded: ") + e.what());
    }
}

std::string GenerativeGrammarChecker::Rewrite(const std::string& text) {
    std::stringstream prompt_ss;
    prompt_ss
        << "<|user|>\n"
        << "You proofread " << language_ << " text produced by OCR.\n"
        << "Rules:\n"
        << "- Fix spelling and grammar mistakes only.\n"
        << "- Keep every line break and the word order.\n"
        << "- Do not rephrase, translate, or add content.\n"
        << "- Output only the corrected text, no explanations.\n"
        << "TEXT:\n" << text << "\n"
        << "<|end|>\n<|assistant|>\n";
    const std::string prompt = prompt_ss.str();

    auto sequences = OgaSequences::Create();
    tokenizer_->Encode(prompt.c_str(), *sequences);
    const size_t prompt_tokens = sequences->SequenceCount(0);
    if (prompt_tokens + SAFETY_MARGIN >= HARD_CONTEXT_CAP) {
        throw CapabilityCallFailure("Prompt of " + std::to_string(prompt_tokens) + " tokens exceeds the model context");
    }

    // The rewrite is about as long as the input; leave room for a little growth.
    const size_t max_length = std::min(HARD_CONTEXT_CAP - SAFETY_MARGIN, prompt_tokens * 2 + SAFETY_MARGIN);

    auto params = OgaGeneratorParams::Create(*model_);
    params->SetSearchOption("max_length", static_cast<double>(max_length));
    params->SetSearchOption("temperature", DEFAULT_TEMPERATURE);
    params->SetSearchOptionBool("do_sample", false);

    auto generator = OgaGenerator::Create(*model_, *params);
    generator->AppendTokenSequences(*sequences);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    while (!generator->IsDone()) {
        if (std::chrono::steady_clock::now() > deadline) {
            throw CapabilityCallFailure("Grammar model exceeded its " + std::to_string(timeout_ms_) + " ms deadline");
        }
        generator->GenerateNextToken();
    }

    const size_t sequence_count = generator->GetSequenceCount(0);
    const int32_t* sequence_data = generator->GetSequenceData(0);
    if (!sequence_data || sequence_count <= prompt_tokens) {
        return text;
    }

    OgaString decoded = tokenizer_->Decode(sequence_data + prompt_tokens, sequence_count - prompt_tokens);
    return TextUtils::Trim(static_cast<const char*>(decoded));
}

std::vector<GrammarMatch> GenerativeGrammarChecker::Check(const std::string& text) {
    if (TextUtils::Trim(text).empty()) return {};
    if (text.size() > MAX_INPUT_CHARS) {
        std::cerr << "[Grammar] Input very long (" << text.size() << " bytes), proceeding with caution" << std::endl;
    }

    std::string rewritten;
    try {
        rewritten = Rewrite(text);
    } catch (const CapabilityCallFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw CapabilityCallFailure(std::string("Grammar model failed: ") + e.what());
    }
    return AlignCorrections(text, rewritten);
}
