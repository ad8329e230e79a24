#pragma once
#include "correction_types.hpp"
#include "grammar_checker.hpp"
#include "spell_checker.hpp"
#include <memory>
#include <string>
#include <vector>

enum class CorrectionStage {
    Hyphenation,
    ConfusableChar,
    Context,
    Grammar,
    Spelling,
    Done
};

struct CapabilityAvailability {
    bool grammar = false;
    bool spelling = false;
};

/**
 * @class CorrectionPipeline
 * @brief Runs the correction stages in their fixed order over one text.
 *
 * Hyphenation -> ConfusableChar -> Context -> Grammar -> Spelling -> Done.
 * Each stage reads the text left by the previous one. A stage disabled in the
 * config, or whose capability was not supplied, is skipped. A stage that
 * throws contributes no issues and the run continues.
 *
 * The grammar and spelling handles are owned by the pipeline and released by
 * Shutdown() or the destructor. Run is not safe to call concurrently.
 */
class CorrectionPipeline {
public:
    explicit CorrectionPipeline(const CorrectionConfig& config,
                                std::unique_ptr<GrammarChecker> grammar = nullptr,
                                std::unique_ptr<SpellChecker> spelling = nullptr);
    ~CorrectionPipeline();

    CorrectionPipeline(const CorrectionPipeline&) = delete;
    CorrectionPipeline& operator=(const CorrectionPipeline&) = delete;

    CorrectionResult Run(const std::string& text);
    void Shutdown();

    CapabilityAvailability Availability() const;
    const CorrectionConfig& Config() const { return config_; }

    static CorrectionStage Next(CorrectionStage stage);
    static const char* StageName(CorrectionStage stage);

private:
    bool Enabled(CorrectionStage stage) const;
    std::vector<CorrectionIssue> FindIssues(CorrectionStage stage, const std::u32string& text);

    const CorrectionConfig config_;
    std::unique_ptr<GrammarChecker> grammar_;
    std::unique_ptr<SpellChecker> spelling_;
};
