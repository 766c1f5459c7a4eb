#include <langlint/translate/factory.hpp>
#include <langlint/util/text.hpp>

namespace langlint {

std::vector<std::string> available_translators() {
    return {"google", "mock"};
}

Result<TranslatorPtr> make_translator(const std::string& name, const Config& config,
                                      LoggerPtr logger) {
    std::string key = text::to_lower(text::trim(name));
    if (key == "google") {
        return TranslatorPtr(std::make_unique<GoogleTranslator>(config.google_config(), std::move(logger)));
    }
    if (key == "mock") {
        return TranslatorPtr(std::make_unique<MockTranslator>(config.mock_config(), std::move(logger)));
    }
    return Error(ErrorCode::INVALID_ARGUMENT, "Unknown translator '" + name + "'", "make_translator");
}

}  // namespace langlint
