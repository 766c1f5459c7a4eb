#include <langlint/translate/translator.hpp>
#include <langlint/util/text.hpp>

#include <algorithm>
#include <atomic>
#include <thread>

namespace langlint {

const char* to_string(TranslationStatus status) {
    switch (status) {
        case TranslationStatus::SUCCESS: return "success";
        case TranslationStatus::FAILED: return "failed";
        case TranslationStatus::PARTIAL: return "partial";
        case TranslationStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

// ============================================================================
// TranslationResult
// ============================================================================

TranslationResult TranslationResult::success(std::string original, std::string translated,
                                             std::string source, std::string target,
                                             double confidence) {
    TranslationResult result;
    result.original_text = std::move(original);
    result.translated_text = std::move(translated);
    result.source_language = std::move(source);
    result.target_language = std::move(target);
    result.status = TranslationStatus::SUCCESS;
    result.confidence = confidence;
    return result;
}

TranslationResult TranslationResult::failed(std::string original, std::string source,
                                            std::string target, std::string error) {
    TranslationResult result;
    result.translated_text = original;
    result.original_text = std::move(original);
    result.source_language = std::move(source);
    result.target_language = std::move(target);
    result.status = TranslationStatus::FAILED;
    result.confidence = 0.0;
    result.metadata["error"] = std::move(error);
    return result;
}

TranslationResult& TranslationResult::with_metadata(const std::string& key, std::string value) {
    metadata[key] = std::move(value);
    return *this;
}

// ============================================================================
// Semaphore
// ============================================================================

Semaphore::Semaphore(size_t capacity) : available_(std::max<size_t>(capacity, 1)) {}

void Semaphore::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return available_ > 0; });
    --available_;
}

void Semaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}

size_t Semaphore::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

// ============================================================================
// Translator
// ============================================================================

Translator::Translator(PacingConfig pacing, LoggerPtr logger)
    : pacing_(std::move(pacing)),
      logger_(logger ? std::move(logger) : make_null_logger()),
      semaphore_(pacing_.max_concurrency) {
    if (pacing_.seed) {
        rng_.seed(*pacing_.seed);
    } else {
        std::random_device device;
        rng_.seed((static_cast<uint64_t>(device()) << 32) | device());
    }
    if (pacing_.delay_max_ms < pacing_.delay_min_ms) {
        std::swap(pacing_.delay_min_ms, pacing_.delay_max_ms);
    }
}

void Translator::set_logger(LoggerPtr logger) {
    logger_ = logger ? std::move(logger) : make_null_logger();
}

std::string Translator::normalize_language_code(const std::string& code) const {
    return text::to_lower(text::trim(code));
}

double Translator::estimate_cost(const std::string& /*text*/, const std::string& /*source*/,
                                 const std::string& /*target*/) const {
    return 0.0;
}

std::map<std::string, std::string> Translator::get_usage_info() const {
    return {
        {"name", name()},
        {"languages", std::to_string(supported_languages().size())}
    };
}

bool Translator::is_language_supported(const std::string& code) const {
    std::string normalized = normalize_language_code(code);
    auto languages = supported_languages();
    return std::find(languages.begin(), languages.end(), normalized) != languages.end();
}

Result<void> Translator::validate_languages(const std::string& source,
                                            const std::string& target) const {
    bool auto_source = supports_auto_detect() && normalize_language_code(source) == "auto";
    if (!auto_source && !is_language_supported(source)) {
        return Error(ErrorCode::UNSUPPORTED_LANGUAGE,
                     "Language '" + source + "' is not supported", name());
    }
    if (!is_language_supported(target)) {
        return Error(ErrorCode::UNSUPPORTED_LANGUAGE,
                     "Language '" + target + "' is not supported", name());
    }
    return Ok();
}

Result<TranslationResult> Translator::translate(const std::string& text,
                                                const std::string& source,
                                                const std::string& target) {
    if (text::trim(text).empty()) {
        return Error(ErrorCode::INVALID_INPUT, "Text cannot be empty", name());
    }
    auto valid = validate_languages(source, target);
    if (!valid) {
        return valid.error();
    }

    std::string source_code = normalize_language_code(source);
    std::string target_code = normalize_language_code(target);

    uint32_t delay_ms = random_between(pacing_.delay_min_ms, pacing_.delay_max_ms);
    pause(std::chrono::milliseconds(delay_ms));

    uint32_t attempts = std::max<uint32_t>(pacing_.retry_count, 1);
    Error last_error(ErrorCode::TRANSLATION_FAILED, "Unknown error", name());

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        Result<std::string> translated = [&]() -> Result<std::string> {
            Semaphore::Permit permit(semaphore_);
            return request(text, source_code, target_code);
        }();

        if (translated) {
            auto result = TranslationResult::success(text, std::move(translated.value()),
                                                     source_code, target_code, next_confidence());
            result.with_metadata("translator", name())
                  .with_metadata("attempt", std::to_string(attempt))
                  .with_metadata("delay_ms", std::to_string(delay_ms));
            annotate(result);
            return result;
        }

        last_error = translated.error();
        logger().debug(name() + ": attempt " + std::to_string(attempt) + "/" +
                       std::to_string(attempts) + " failed: " + last_error.to_string());
        if (attempt < attempts) {
            pause(std::chrono::milliseconds(static_cast<int64_t>(pacing_.backoff_ms) * attempt));
        }
    }

    return last_error;
}

Result<std::vector<TranslationResult>> Translator::translate_batch(
    const std::vector<std::string>& texts, const std::string& source, const std::string& target) {
    auto valid = validate_languages(source, target);
    if (!valid) {
        return valid.error();
    }

    std::string source_code = normalize_language_code(source);
    std::string target_code = normalize_language_code(target);

    std::vector<TranslationResult> results(texts.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t index = next++; index < texts.size(); index = next++) {
            auto translated = translate(texts[index], source, target);
            TranslationResult result;
            if (translated) {
                result = std::move(translated.value());
            } else {
                logger().warning(name() + ": batch item " + std::to_string(index) +
                                 " failed: " + translated.error().to_string());
                result = TranslationResult::failed(texts[index], source_code, target_code,
                                                   translated.error().to_string());
            }
            result.with_metadata("batch_index", std::to_string(index));
            results[index] = std::move(result);
        }
    };

    size_t worker_count = std::min(texts.size(), std::max<size_t>(pacing_.max_concurrency, 1));
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    return results;
}

uint32_t Translator::random_between(uint32_t min, uint32_t max) {
    if (max <= min) return min;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<uint32_t> dist(min, max);
    return dist(rng_);
}

double Translator::random_between(double min, double max) {
    if (max <= min) return min;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(min, max);
    return dist(rng_);
}

double Translator::random_unit() {
    return random_between(0.0, 1.0);
}

void Translator::pause(std::chrono::milliseconds duration) const {
    if (duration.count() <= 0) return;
    if (pacing_.sleep) {
        pacing_.sleep(duration);
    } else {
        std::this_thread::sleep_for(duration);
    }
}

}  // namespace langlint
