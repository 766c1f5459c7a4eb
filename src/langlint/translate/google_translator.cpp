#include <langlint/translate/google_translator.hpp>
#include <langlint/util/text.hpp>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <mutex>

namespace langlint {

using json = nlohmann::json;

namespace {

const std::vector<std::string>& language_codes() {
    static const std::vector<std::string> codes = {
        "en", "zh-CN", "zh-TW", "ja", "ko", "fr", "de", "es", "it", "pt", "ru",
        "ar", "hi", "th", "vi", "id", "nl", "sv", "da", "no", "fi", "pl", "tr",
        "cs", "hu", "ro", "bg", "el", "he", "uk"
    };
    return codes;
}

void init_curl_once() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

size_t buffer_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string escape(CURL* handle, const std::string& value) {
    char* escaped = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}  // namespace

GoogleTranslator::GoogleTranslator(GoogleConfig config, LoggerPtr logger)
    : Translator(config.pacing, std::move(logger)), config_(std::move(config)) {}

std::vector<std::string> GoogleTranslator::supported_languages() const {
    return language_codes();
}

std::string GoogleTranslator::normalize_language_code(const std::string& code) const {
    std::string normalized = text::to_lower(text::trim(code));
    for (char& c : normalized) {
        if (c == '_') c = '-';
    }

    if (normalized == "zh" || normalized == "zh-cn" || normalized == "zh-hans" ||
        normalized == "zh-sg") {
        return "zh-CN";
    }
    if (normalized == "zh-tw" || normalized == "zh-hant" || normalized == "zh-hk" ||
        normalized == "zh-mo") {
        return "zh-TW";
    }

    size_t separator = normalized.find('-');
    if (separator != std::string::npos) {
        normalized.resize(separator);
    }
    // Legacy code for Hebrew
    if (normalized == "iw") {
        return "he";
    }
    return normalized;
}

std::map<std::string, std::string> GoogleTranslator::get_usage_info() const {
    auto info = Translator::get_usage_info();
    info["cost_per_character"] = "0.0";
    info["max_batch_size"] = "100";
    info["rate_limit"] = "Limited (delays added)";
    info["timeout"] = std::to_string(config_.timeout_ms / 1000) + "s";
    info["retry_count"] = std::to_string(pacing().retry_count);
    return info;
}

std::string GoogleTranslator::build_url(const std::string& text, const std::string& source,
                                        const std::string& target) const {
    init_curl_once();
    CurlHandle handle(curl_easy_init());

    std::string url = config_.endpoint;
    url += url.find('?') == std::string::npos ? '?' : '&';
    url += "client=" + escape(handle.get(), config_.client);
    url += "&sl=" + escape(handle.get(), source);
    url += "&tl=" + escape(handle.get(), target);
    url += "&dt=t";
    url += "&q=" + escape(handle.get(), text);
    return url;
}

Result<std::string> GoogleTranslator::parse_response(const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::exception& e) {
        return Error(ErrorCode::TRANSLATION_FAILED,
                     std::string("Failed to parse response: ") + e.what(),
                     "Google Translate", "PARSE_ERROR");
    }

    Error shape_error(ErrorCode::TRANSLATION_FAILED, "Failed to extract translation from response",
                      "Google Translate", "EXTRACTION_ERROR");
    if (!response.is_array() || response.empty() || !response[0].is_array()) {
        return shape_error;
    }

    // Long input comes back split into several sentence segments
    std::string translated;
    bool found = false;
    for (const auto& segment : response[0]) {
        if (!segment.is_array() || segment.empty() || !segment[0].is_string()) {
            continue;
        }
        translated += segment[0].get<std::string>();
        found = true;
    }
    if (!found) {
        return shape_error;
    }
    return translated;
}

Result<std::string> GoogleTranslator::request(const std::string& text, const std::string& source,
                                              const std::string& target) {
    auto response = http_get(build_url(text, source, target));
    if (!response) {
        return response.error();
    }

    long status = response.value().status;
    if (status < 200 || status >= 300) {
        return Error(ErrorCode::TRANSLATION_FAILED,
                     "HTTP error: " + std::to_string(status), name(), std::to_string(status));
    }
    return parse_response(response.value().body);
}

Result<GoogleTranslator::HttpResponse> GoogleTranslator::http_get(const std::string& url) {
    init_curl_once();
    CurlHandle handle(curl_easy_init());
    if (!handle) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL", name());
    }

    CURL* curl = handle.get();
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, buffer_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "langlint/0.1");

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error(ErrorCode::TIMEOUT, "Request timed out", name());
    }
    if (res != CURLE_OK) {
        return Error(ErrorCode::NETWORK_ERROR,
                     std::string("Network error: ") + curl_easy_strerror(res), name());
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace langlint
