#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace langlint::cli {

/**
 * List the translatable units of a file or directory tree.
 */
class ScanCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "scan"; }
    std::string description() const override {
        return "Scan files for translatable comments and docstrings";
    }

private:
    std::string path_;
    std::string format_ = "text";
    std::string priority_;
    std::vector<std::string> types_;
    std::string output_;

    void print_text(std::ostream& out, const std::string& file,
                    const std::vector<TranslatableUnit>& units) const;
};

}  // namespace langlint::cli
