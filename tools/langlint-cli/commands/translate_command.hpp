#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace langlint::cli {

struct TranslateOptions {
    std::string source;
    std::string target;
    std::filesystem::path output;   // Empty: overwrite the input
    bool dry_run = false;
    bool backup = true;
};

/**
 * Translate one file through `pipeline` and write the result.
 * In-place writes copy the original to "<file>.backup" first when enabled;
 * unchanged files are never rewritten.
 */
Result<PipelineResult> translate_file(Pipeline& pipeline, const std::filesystem::path& path,
                                      const TranslateOptions& options, Logger& logger);

/**
 * Translate a single file.
 */
class TranslateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "translate"; }
    std::string description() const override {
        return "Translate comments and docstrings of one file";
    }

private:
    std::string path_;
    std::string source_;
    std::string target_;
    std::string translator_;
    std::string output_;
    bool dry_run_ = false;
    bool no_backup_ = false;
};

}  // namespace langlint::cli
