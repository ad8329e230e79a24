#include "languagetool_client.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <mutex>

using json = nlohmann::json;

namespace {
std::once_flag curl_init_flag;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* body) {
    size_t total = size * nmemb;
    body->append(static_cast<char*>(contents), total);
    return total;
}

std::string Escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) return "";
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

// UTF-16 unit index -> code point index, for every boundary in `text`.
std::vector<size_t> Utf16ToCodePoint(const std::u32string& text) {
    std::vector<size_t> map;
    map.reserve(text.size() + 1);
    for (size_t i = 0; i < text.size(); ++i) {
        map.push_back(i);
        if (text[i] > 0xFFFF) map.push_back(i);  // second half of a surrogate pair
    }
    map.push_back(text.size());
    return map;
}
}

LanguageToolClient::LanguageToolClient(const std::string& base_url, const std::string& language, long timeout_ms)
    : base_url_(base_url), language_(language), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    std::cout << "[LanguageTool] Connecting to: " << base_url_ << std::endl;
    try {
        json languages = json::parse(Request("/v2/languages", ""));
        if (!languages.is_array()) {
            throw CapabilityUnavailable("Unexpected /v2/languages response from " + base_url_);
        }
    } catch (const CapabilityCallFailure& e) {
        throw CapabilityUnavailable(std::string("LanguageTool is not reachable: ") + e.what());
    } catch (const json::exception& e) {
        throw CapabilityUnavailable(std::string("LanguageTool answered with invalid JSON: ") + e.what());
    }
}

std::string LanguageToolClient::Request(const std::string& path, const std::string& form) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw CapabilityCallFailure("Failed to initialize CURL");
    }

    const std::string url = base_url_ + path;
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_ / 3);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    if (!form.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw CapabilityCallFailure(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw CapabilityCallFailure("LanguageTool " + path + " returned HTTP " + std::to_string(http_code));
    }
    return body;
}

std::vector<GrammarMatch> LanguageToolClient::Check(const std::string& text) {
    if (text.empty()) return {};

    std::string form;
    {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) throw CapabilityCallFailure("Failed to initialize CURL");
        form = "language=" + Escape(curl.get(), language_) + "&text=" + Escape(curl.get(), text);
    }

    const std::string body = Request("/v2/check", form);
    try {
        return ParseResponse(body, text);
    } catch (const json::exception& e) {
        throw CapabilityCallFailure(std::string("Malformed LanguageTool response: ") + e.what());
    }
}

std::vector<GrammarMatch> LanguageToolClient::ParseResponse(const std::string& body, const std::string& text) {
    const json response = json::parse(body);
    const std::vector<size_t> offsets = Utf16ToCodePoint(TextUtils::ToU32(text));

    std::vector<GrammarMatch> matches;
    for (const auto& item : response.value("matches", json::array())) {
        size_t begin16 = item.at("offset").get<size_t>();
        size_t end16 = begin16 + item.at("length").get<size_t>();
        if (end16 >= offsets.size()) continue;

        GrammarMatch match;
        match.offset = offsets[begin16];
        match.length = offsets[end16] - match.offset;
        if (item.contains("rule") && item["rule"].contains("category")) {
            match.category = item["rule"]["category"].value("id", "");
        }
        for (const auto& replacement : item.value("replacements", json::array())) {
            match.replacements.push_back(replacement.value("value", ""));
        }
        matches.push_back(std::move(match));
    }
    return matches;
}
