#pragma once
#include "grammar_checker.hpp"
#include <string>

/**
 * @class LanguageToolClient
 * @brief GrammarChecker backed by a LanguageTool HTTP server (/v2/check).
 *
 * The constructor probes /v2/languages and throws CapabilityUnavailable when
 * the server does not answer. Every request carries `timeout_ms`.
 */
class LanguageToolClient : public GrammarChecker {
public:
    LanguageToolClient(const std::string& base_url, const std::string& language = "ru-RU", long timeout_ms = 15000);

    std::vector<GrammarMatch> Check(const std::string& text) override;
    std::string Name() const override { return "languagetool"; }

    // Parses a /v2/check response body; offsets are converted from UTF-16 units.
    static std::vector<GrammarMatch> ParseResponse(const std::string& body, const std::string& text);

private:
    std::string Request(const std::string& path, const std::string& form) const;

    std::string base_url_;
    std::string language_;
    long timeout_ms_;
};
