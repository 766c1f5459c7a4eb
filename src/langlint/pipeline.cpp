#include <langlint/pipeline.hpp>
#include <langlint/util/text.hpp>

#include <map>

namespace langlint {

bool UnitFilter::accepts(const TranslatableUnit& unit) const {
    if (!at_least(unit.priority, min_priority)) {
        return false;
    }
    if (!unit_types.empty() && unit_types.count(unit.unit_type) == 0) {
        return false;
    }
    if (languages.empty()) {
        return true;
    }
    if (!unit.detected_language) {
        return false;
    }
    std::string detected = text::to_lower(*unit.detected_language);
    for (const auto& language : languages) {
        std::string wanted = text::to_lower(language);
        if (detected == wanted || text::starts_with(detected, wanted + "-")) {
            return true;
        }
    }
    return false;
}

Pipeline::Pipeline(const ParserRegistry& registry, Translator* translator,
                   Cache* cache, LoggerPtr logger)
    : registry_(registry),
      translator_(translator),
      cache_(cache),
      logger_(logger ? std::move(logger) : make_null_logger()) {}

Result<ParseResult> Pipeline::scan(const std::string& content, const std::string& path) const {
    std::string key;
    if (cache_) {
        key = Cache::generate_key(path, content);
        if (auto cached = cache_->get(key)) {
            logger_->debug("Cache hit: " + path);
            return *cached;
        }
    }

    auto parsed = registry_.extract(content, path);
    if (!parsed) {
        return parsed.error();
    }
    if (cache_) {
        cache_->set(key, parsed.value());
    }
    return parsed;
}

Result<PipelineResult> Pipeline::translate(const std::string& content, const std::string& path,
                                           const std::string& source, const std::string& target,
                                           const UnitFilter& filter) {
    if (!translator_) {
        return Error(ErrorCode::INVALID_ARGUMENT, "No translator configured", "Pipeline");
    }

    auto parsed = scan(content, path);
    if (!parsed) {
        return parsed.error();
    }

    PipelineResult result;
    result.parse = std::move(parsed.value());
    result.units_total = result.parse.units.size();
    auto& units = result.parse.units;

    // Source language -> indices of units translated from it
    bool group_by_detection = translator_->normalize_language_code(source) == "auto" &&
                              !translator_->supports_auto_detect();
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < units.size(); ++i) {
        if (!filter.accepts(units[i])) {
            continue;
        }
        if (!group_by_detection) {
            groups[source].push_back(i);
        } else if (units[i].detected_language &&
                   translator_->is_language_supported(*units[i].detected_language)) {
            groups[*units[i].detected_language].push_back(i);
        }
    }

    size_t selected = 0;
    for (const auto& [language, indices] : groups) {
        selected += indices.size();

        std::vector<std::string> texts;
        texts.reserve(indices.size());
        for (size_t index : indices) {
            texts.push_back(units[index].content);
        }

        auto batch = translator_->translate_batch(texts, language, target);
        if (!batch) {
            return batch.error();
        }

        const auto& translations = batch.value();
        for (size_t k = 0; k < indices.size() && k < translations.size(); ++k) {
            const TranslationResult& translation = translations[k];
            TranslatableUnit& unit = units[indices[k]];
            if (!translation.ok()) {
                ++result.units_failed;
                continue;
            }
            if (translation.translated_text != unit.content) {
                unit.content = translation.translated_text;
                ++result.units_translated;
            }
        }
    }
    result.units_skipped = result.units_total - selected;

    if (!result.changed()) {
        result.content = content;
        return result;
    }

    auto rebuilt = registry_.reconstruct(content, units, path);
    if (!rebuilt) {
        return rebuilt.error();
    }
    result.content = std::move(rebuilt.value());
    logger_->info(path + ": translated " + std::to_string(result.units_translated) + "/" +
                  std::to_string(result.units_total) + " units");
    return result;
}

}  // namespace langlint
