#pragma once

#include <langlint/result.hpp>
#include <langlint/util/logger.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace langlint {

// ============================================================================
// Common Types
// ============================================================================

enum class TranslationStatus {
    SUCCESS,
    FAILED,
    PARTIAL,
    SKIPPED
};

const char* to_string(TranslationStatus status);

/**
 * Outcome of translating one text.
 * A failed result carries the original text as its translation, so
 * writing it back is always safe.
 */
struct TranslationResult {
    std::string original_text;
    std::string translated_text;
    std::string source_language;
    std::string target_language;
    TranslationStatus status = TranslationStatus::SUCCESS;
    double confidence = 0.0;
    std::map<std::string, std::string> metadata;

    bool ok() const { return status == TranslationStatus::SUCCESS; }

    static TranslationResult success(std::string original, std::string translated,
                                     std::string source, std::string target,
                                     double confidence);

    // Records `error` under metadata "error"; translated_text = original
    static TranslationResult failed(std::string original, std::string source,
                                    std::string target, std::string error);

    TranslationResult& with_metadata(const std::string& key, std::string value);
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * Rate limiting and retry settings shared by all backends.
 */
struct PacingConfig {
    uint32_t delay_min_ms = 300;      // Random pause before each translate()
    uint32_t delay_max_ms = 600;
    uint32_t retry_count = 3;         // Total attempts (at least one is made)
    uint32_t backoff_ms = 500;        // Wait backoff_ms * attempt between attempts
    size_t max_concurrency = 3;       // In-flight requests per translator
    std::optional<uint64_t> seed;     // Fixed seed for delays and simulated randomness
    SleepFunction sleep = nullptr;    // Defaults to std::this_thread::sleep_for
};

/**
 * Counting semaphore bounding in-flight requests.
 */
class Semaphore {
public:
    explicit Semaphore(size_t capacity);

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    void acquire();
    void release();

    size_t available() const;

    // Holds one slot for its lifetime
    class Permit {
    public:
        explicit Permit(Semaphore& semaphore) : semaphore_(semaphore) { semaphore_.acquire(); }
        ~Permit() { semaphore_.release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        Semaphore& semaphore_;
    };

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
};

// ============================================================================
// Abstract Translator Interface
// ============================================================================

/**
 * Base class of translation backends.
 *
 * translate() validates input and languages, pauses for a random delay,
 * then calls request() up to retry_count times with linear backoff.
 * translate_batch() fans out over at most max_concurrency worker threads
 * and always returns one result per input, in input order.
 *
 * Backends implement request(): one attempt, no pacing, with language
 * codes already normalized.
 */
class Translator {
public:
    explicit Translator(PacingConfig pacing, LoggerPtr logger = nullptr);
    virtual ~Translator() = default;

    Translator(const Translator&) = delete;
    Translator& operator=(const Translator&) = delete;

    virtual std::string name() const = 0;
    virtual std::vector<std::string> supported_languages() const = 0;

    // Default: lowercase
    virtual std::string normalize_language_code(const std::string& code) const;

    // Whether "auto" is accepted as a source language
    virtual bool supports_auto_detect() const { return false; }

    virtual double estimate_cost(const std::string& text, const std::string& source,
                                 const std::string& target) const;

    // name, languages, cost_per_character, max_batch_size, rate_limit, ...
    virtual std::map<std::string, std::string> get_usage_info() const;

    bool is_language_supported(const std::string& code) const;

    // UNSUPPORTED_LANGUAGE naming the offending code
    Result<void> validate_languages(const std::string& source, const std::string& target) const;

    /**
     * Translate one text.
     *
     * @return INVALID_INPUT for empty text, UNSUPPORTED_LANGUAGE, or the
     *         error of the last attempt
     */
    Result<TranslationResult> translate(const std::string& text, const std::string& source,
                                        const std::string& target);

    /**
     * Translate many texts. Fails as a whole only on unsupported
     * languages; a failing item becomes a FAILED result. Every result
     * carries metadata "batch_index".
     */
    Result<std::vector<TranslationResult>> translate_batch(const std::vector<std::string>& texts,
                                                           const std::string& source,
                                                           const std::string& target);

    const PacingConfig& pacing() const { return pacing_; }
    void set_logger(LoggerPtr logger);

protected:
    virtual Result<std::string> request(const std::string& text, const std::string& source,
                                        const std::string& target) = 0;

    // Confidence reported with a successful result
    virtual double next_confidence() { return 1.0; }

    // Backend-specific metadata on successful results
    virtual void annotate(TranslationResult& /*result*/) const {}

    uint32_t random_between(uint32_t min, uint32_t max);
    double random_between(double min, double max);
    double random_unit();

    void pause(std::chrono::milliseconds duration) const;

    Logger& logger() const { return *logger_; }

private:
    PacingConfig pacing_;
    LoggerPtr logger_;
    Semaphore semaphore_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

using TranslatorPtr = std::unique_ptr<Translator>;

}  // namespace langlint
