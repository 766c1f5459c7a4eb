#include <langlint/parsers/parser.hpp>
#include <langlint/util/text.hpp>

namespace langlint {

bool Parser::has_supported_extension(const std::string& path) const {
    std::string ext = text::extension_of(path);
    if (ext.empty()) {
        return false;
    }
    return supported_extensions().count(ext) > 0;
}

}  // namespace langlint
