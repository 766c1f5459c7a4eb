#include "translate_command.hpp"

namespace langlint::cli {

Result<PipelineResult> translate_file(Pipeline& pipeline, const std::filesystem::path& path,
                                      const TranslateOptions& options, Logger& logger) {
    auto content = read_file(path);
    if (!content.ok()) {
        return content.error();
    }

    auto result = pipeline.translate(content.value(), path.string(), options.source, options.target);
    if (!result.ok()) {
        return result.error();
    }

    const PipelineResult& outcome = result.value();
    if (options.dry_run) {
        logger.info(path.string() + ": " + std::to_string(outcome.units_translated) +
                    " unit(s) would change (dry run)");
        return result;
    }

    std::filesystem::path destination = options.output.empty() ? path : options.output;
    bool in_place = options.output.empty();
    if (in_place && !outcome.changed()) {
        return result;
    }
    if (in_place && options.backup) {
        auto backup = create_backup(path);
        if (!backup.ok()) {
            return backup.error();
        }
    }

    auto written = write_file(destination, outcome.content);
    if (!written.ok()) {
        return written.error();
    }
    return result;
}

void TranslateCommand::setup(CLI::App& app) {
    app.add_option("file", path_, "File to translate")
        ->required()
        ->type_name("<file>");

    app.add_option("-s,--source", source_, "Source language (default: from config, or auto)")
        ->type_name("<lang>");

    app.add_option("-t,--target", target_, "Target language (default: from config, or en)")
        ->type_name("<lang>");

    app.add_option("--translator", translator_, "Backend: google or mock")
        ->type_name("<name>");

    app.add_option("-o,--output", output_, "Write to this file instead of in place")
        ->type_name("<file>");

    app.add_flag("--dry-run", dry_run_, "Show what would change without writing");
    app.add_flag("--no-backup", no_backup_, "Do not create a .backup copy");
}

int TranslateCommand::execute(CommandContext& ctx) {
    const Config& config = ctx.config;
    std::string translator_name = translator_.empty() ? config.translator : translator_;

    auto translator = make_translator(translator_name, config, ctx.logger);
    if (!translator.ok()) {
        std::cerr << "Error: " << translator.error().to_string() << "\n";
        return exit_code_for(translator.error());
    }

    if (!ctx.registry->find(path_)) {
        auto content = read_file(path_);
        if (!content.ok()) {
            std::cerr << "Error: " << content.error().to_string() << "\n";
            return exit_code_for(content.error());
        }
        if (!ctx.registry->find(path_, content.value())) {
            std::cerr << "Error: unsupported file type: " << path_ << "\n";
            return LANGLINT_EXIT_USER_ERROR;
        }
    }

    TranslateOptions options;
    options.source = source_.empty() ? config.primary_source_lang() : source_;
    options.target = target_.empty() ? config.target_lang : target_;
    options.output = output_;
    options.dry_run = dry_run_ || config.dry_run;
    options.backup = config.backup && !no_backup_;

    Pipeline pipeline(*ctx.registry, translator.value().get(), nullptr, ctx.logger);
    auto result = translate_file(pipeline, path_, options, *ctx.logger);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error());
    }

    const PipelineResult& outcome = result.value();
    std::cout << path_ << ": " << outcome.units_translated << " translated, "
              << outcome.units_failed << " failed, " << outcome.units_skipped
              << " skipped of " << outcome.units_total << " unit(s)\n";
    if (options.dry_run && outcome.changed()) {
        std::cout << outcome.content;
    }
    return outcome.units_failed > 0 ? LANGLINT_EXIT_IO_ERROR : LANGLINT_EXIT_SUCCESS;
}

}  // namespace langlint::cli
