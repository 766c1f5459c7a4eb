#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace langlint::cli {

/**
 * Translate every supported file under a path in place.
 */
class FixCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "fix"; }
    std::string description() const override {
        return "Translate files in place (with .backup copies)";
    }

private:
    std::string path_;
    std::string source_;
    std::string target_;
    std::string translator_;
    bool dry_run_ = false;
    bool no_backup_ = false;
};

}  // namespace langlint::cli
