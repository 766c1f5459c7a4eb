#pragma once

#include <langlint/config.hpp>
#include <langlint/translate/translator.hpp>

namespace langlint {

// Names accepted by make_translator()
std::vector<std::string> available_translators();

/**
 * Create a backend by name ("google" or "mock") configured from `config`.
 * Unknown names are INVALID_ARGUMENT.
 */
Result<TranslatorPtr> make_translator(const std::string& name, const Config& config,
                                      LoggerPtr logger = nullptr);

}  // namespace langlint
