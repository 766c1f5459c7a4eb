#include <langlint/config.hpp>
#include <langlint/util/text.hpp>

#include <nlohmann/json.hpp>

#include <fnmatch.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace langlint {

using json = nlohmann::json;

namespace {

template<typename T>
Result<void> read_field(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return Ok();
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        return Error(ErrorCode::PARSE_ERROR,
                     std::string("Invalid value for '") + key + "': " + e.what(), "Config");
    }
    return Ok();
}

// Unsigned settings; a negative number would wrap around
template<typename T>
Result<void> read_count(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_number() && it->get<double>() < 0) {
        return Error(ErrorCode::INVALID_INPUT,
                     std::string("Value for '") + key + "' must not be negative", "Config");
    }
    return read_field(doc, key, out);
}

// "source_lang" may be a single string or a list
Result<void> read_string_list(const json& doc, const char* key, std::vector<std::string>& out) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_string()) {
        out = {it->get<std::string>()};
        return Ok();
    }
    return read_field(doc, key, out);
}

bool glob_match(const std::string& pattern, const std::string& relative_path) {
    if (fnmatch(pattern.c_str(), relative_path.c_str(), 0) == 0) {
        return true;
    }
    if (text::starts_with(relative_path, pattern + "/")) {
        return true;
    }
    for (const auto& component : fs::path(relative_path)) {
        if (fnmatch(pattern.c_str(), component.string().c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

Result<Config> Config::from_json_string(const std::string& content) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::exception& e) {
        return Error(ErrorCode::PARSE_ERROR, std::string("Invalid config JSON: ") + e.what(), "Config");
    }
    if (!doc.is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "Config root must be an object", "Config");
    }

    Config config;
    for (auto result : {
             read_string_list(doc, "include", config.include),
             read_string_list(doc, "exclude", config.exclude),
             read_string_list(doc, "source_lang", config.source_lang),
             read_field(doc, "target_lang", config.target_lang),
             read_field(doc, "translator", config.translator),
             read_field(doc, "dry_run", config.dry_run),
             read_field(doc, "backup", config.backup),
             read_count(doc, "max_concurrency", config.max_concurrency),
             read_count(doc, "retry_count", config.retry_count),
             read_count(doc, "delay_min_ms", config.delay_min_ms),
             read_count(doc, "delay_max_ms", config.delay_max_ms)}) {
        if (!result) {
            return result.error();
        }
    }
    return config;
}

Result<Config> Config::load_from_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Config file not found", "Config", path.string());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Failed to read config file", "Config", path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto config = from_json_string(ss.str());
    if (!config) {
        const Error& err = config.error();
        return Error(err.code(), err.message(), err.origin(), path.string());
    }
    return config;
}

Result<Config> Config::find_and_load(const fs::path& directory) {
    for (const char* name : CONFIG_FILE_NAMES) {
        fs::path candidate = directory / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return load_from_file(candidate);
        }
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* target = std::getenv("LANGLINT_TARGET_LANG"); target && *target) {
        target_lang = target;
    }
    if (const char* source = std::getenv("LANGLINT_SOURCE_LANG"); source && *source) {
        source_lang = {source};
    }
    if (const char* name = std::getenv("LANGLINT_TRANSLATOR"); name && *name) {
        translator = name;
    }
}

Config Config::merge(const Config& other) const {
    const Config defaults;
    Config merged = *this;
    if (!other.include.empty()) merged.include = other.include;
    if (!other.exclude.empty()) merged.exclude = other.exclude;
    if (other.source_lang != defaults.source_lang) merged.source_lang = other.source_lang;
    if (other.target_lang != defaults.target_lang) merged.target_lang = other.target_lang;
    if (other.translator != defaults.translator) merged.translator = other.translator;
    if (other.dry_run) merged.dry_run = true;
    if (other.backup != defaults.backup) merged.backup = other.backup;
    if (other.max_concurrency != defaults.max_concurrency) merged.max_concurrency = other.max_concurrency;
    if (other.retry_count != defaults.retry_count) merged.retry_count = other.retry_count;
    if (other.delay_min_ms != defaults.delay_min_ms) merged.delay_min_ms = other.delay_min_ms;
    if (other.delay_max_ms != defaults.delay_max_ms) merged.delay_max_ms = other.delay_max_ms;
    return merged;
}

bool Config::is_included(const std::string& relative_path) const {
    for (const auto& pattern : exclude) {
        if (glob_match(pattern, relative_path)) {
            return false;
        }
    }
    if (include.empty()) {
        return true;
    }
    for (const auto& pattern : include) {
        if (glob_match(pattern, relative_path)) {
            return true;
        }
    }
    return false;
}

std::string Config::primary_source_lang() const {
    return source_lang.empty() ? std::string("auto") : source_lang.front();
}

PacingConfig Config::pacing() const {
    PacingConfig pacing;
    pacing.delay_min_ms = delay_min_ms;
    pacing.delay_max_ms = delay_max_ms;
    pacing.retry_count = retry_count;
    pacing.max_concurrency = max_concurrency;
    return pacing;
}

GoogleConfig Config::google_config() const {
    GoogleConfig config;
    config.pacing = pacing();
    return config;
}

MockConfig Config::mock_config() const {
    MockConfig config;
    config.pacing.max_concurrency = max_concurrency;
    return config;
}

}  // namespace langlint
