#pragma once

#include "translator.hpp"

namespace langlint {

struct GoogleConfig {
    std::string endpoint = "https://translate.googleapis.com/translate_a/single";
    std::string client = "gtx";
    int timeout_ms = 30000;
    PacingConfig pacing;
};

/**
 * Backend for the public Google Translate web endpoint.
 *
 * Sends GET {endpoint}?client=..&sl=..&tl=..&dt=t&q=.. and reads the
 * translated segments from the nested-array response.
 */
class GoogleTranslator : public Translator {
public:
    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    explicit GoogleTranslator(GoogleConfig config = {}, LoggerPtr logger = nullptr);

    std::string name() const override { return "Google Translate"; }
    std::vector<std::string> supported_languages() const override;

    /**
     * Lowercase and collapse regional variants to the base code, except
     * Chinese: zh, zh-cn, zh-hans -> "zh-CN"; zh-tw, zh-hant, zh-hk -> "zh-TW".
     */
    std::string normalize_language_code(const std::string& code) const override;

    bool supports_auto_detect() const override { return true; }

    std::map<std::string, std::string> get_usage_info() const override;

    std::string build_url(const std::string& text, const std::string& source,
                          const std::string& target) const;

    /**
     * Join the translated segments response[0][i][0].
     * TRANSLATION_FAILED with detail PARSE_ERROR for invalid JSON and
     * EXTRACTION_ERROR for an unexpected shape.
     */
    static Result<std::string> parse_response(const std::string& body);

protected:
    Result<std::string> request(const std::string& text, const std::string& source,
                                const std::string& target) override;
    double next_confidence() override { return CONFIDENCE; }

    // Transport; NETWORK_ERROR or TIMEOUT on failure
    virtual Result<HttpResponse> http_get(const std::string& url);

    static constexpr double CONFIDENCE = 0.9;

private:
    GoogleConfig config_;
};

}  // namespace langlint
