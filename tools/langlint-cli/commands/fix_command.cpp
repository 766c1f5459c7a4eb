#include "fix_command.hpp"
#include "translate_command.hpp"

namespace langlint::cli {

void FixCommand::setup(CLI::App& app) {
    app.add_option("path", path_, "File or directory to fix")
        ->required()
        ->type_name("<path>");

    app.add_option("-s,--source", source_, "Source language (default: from config, or auto)")
        ->type_name("<lang>");

    app.add_option("-t,--target", target_, "Target language (default: from config, or en)")
        ->type_name("<lang>");

    app.add_option("--translator", translator_, "Backend: google or mock")
        ->type_name("<name>");

    app.add_flag("--dry-run", dry_run_, "Show what would change without writing");
    app.add_flag("--no-backup", no_backup_, "Do not create .backup copies");
}

int FixCommand::execute(CommandContext& ctx) {
    const Config& config = ctx.config;
    std::string translator_name = translator_.empty() ? config.translator : translator_;

    auto translator = make_translator(translator_name, config, ctx.logger);
    if (!translator.ok()) {
        std::cerr << "Error: " << translator.error().to_string() << "\n";
        return exit_code_for(translator.error());
    }

    auto files = collect_files(path_, config, *ctx.registry);
    if (!files.ok()) {
        std::cerr << "Error: " << files.error().to_string() << "\n";
        return exit_code_for(files.error());
    }

    TranslateOptions options;
    options.source = source_.empty() ? config.primary_source_lang() : source_;
    options.target = target_.empty() ? config.target_lang : target_;
    options.dry_run = dry_run_ || config.dry_run;
    options.backup = config.backup && !no_backup_;

    Cache cache;
    Pipeline pipeline(*ctx.registry, translator.value().get(), &cache, ctx.logger);

    size_t changed = 0;
    size_t failed = 0;
    for (const auto& file : files.value()) {
        auto result = translate_file(pipeline, file, options, *ctx.logger);
        if (!result.ok()) {
            ctx.logger->error(file.string() + ": " + result.error().to_string());
            ++failed;
            continue;
        }
        if (result.value().changed()) {
            ++changed;
            std::cout << (options.dry_run ? "would fix: " : "fixed: ") << file.string() << "\n";
        }
    }

    std::cout << changed << " of " << files.value().size() << " file(s) "
              << (options.dry_run ? "would change" : "changed");
    if (failed > 0) {
        std::cout << ", " << failed << " failed";
    }
    std::cout << "\n";
    if (!options.dry_run && options.backup && changed > 0) {
        std::cout << "Backups created with .backup extension\n";
    }
    return failed > 0 ? LANGLINT_EXIT_IO_ERROR : LANGLINT_EXIT_SUCCESS;
}

}  // namespace langlint::cli
