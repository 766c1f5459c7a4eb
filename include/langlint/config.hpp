#pragma once

#include <langlint/result.hpp>
#include <langlint/translate/google_translator.hpp>
#include <langlint/translate/mock_translator.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace langlint {

namespace fs = std::filesystem;

/**
 * Project settings, read from `.langlint.json` or `langlint.json`.
 *
 * {
 *   "include": ["src"], "exclude": ["*.min.js"],
 *   "source_lang": ["auto"], "target_lang": "en", "translator": "google",
 *   "dry_run": false, "backup": true,
 *   "max_concurrency": 3, "retry_count": 3,
 *   "delay_min_ms": 300, "delay_max_ms": 600
 * }
 */
struct Config {
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::vector<std::string> source_lang = {"auto"};
    std::string target_lang = "en";
    std::string translator = "google";
    bool dry_run = false;
    bool backup = true;

    size_t max_concurrency = 3;
    uint32_t retry_count = 3;
    uint32_t delay_min_ms = 300;
    uint32_t delay_max_ms = 600;

    static constexpr const char* CONFIG_FILE_NAMES[] = {".langlint.json", "langlint.json"};

    // NOT_FOUND, IO_ERROR, or PARSE_ERROR for malformed / wrongly-typed JSON
    static Result<Config> load_from_file(const fs::path& path);

    // Parse a JSON document; unknown keys are ignored
    static Result<Config> from_json_string(const std::string& content);

    // First config file found in `directory`, or defaults
    static Result<Config> find_and_load(const fs::path& directory = fs::current_path());

    // Overrides from LANGLINT_TARGET_LANG, LANGLINT_SOURCE_LANG, LANGLINT_TRANSLATOR
    void apply_env();

    // Fields of `other` that differ from the defaults win
    Config merge(const Config& other) const;

    /**
     * Include/exclude check for a path relative to the scanned root.
     * An empty include list accepts everything; excludes always win.
     */
    bool is_included(const std::string& relative_path) const;

    // First entry of source_lang ("auto" when empty)
    std::string primary_source_lang() const;

    PacingConfig pacing() const;
    GoogleConfig google_config() const;
    MockConfig mock_config() const;
};

}  // namespace langlint
