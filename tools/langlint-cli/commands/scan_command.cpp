#include "scan_command.hpp"

namespace langlint::cli {

void ScanCommand::setup(CLI::App& app) {
    app.add_option("path", path_, "File or directory to scan")
        ->required()
        ->type_name("<path>");

    app.add_option("-f,--format", format_, "Output format: text or json")
        ->check(CLI::IsMember({"text", "json"}))
        ->type_name("<format>");

    app.add_option("-p,--priority", priority_, "Minimum priority: high, medium, low")
        ->type_name("<priority>");

    app.add_option("--type", types_, "Unit type to keep (repeatable)")
        ->type_name("<type>");

    app.add_option("-o,--output", output_, "Write the report to a file")
        ->type_name("<file>");
}

int ScanCommand::execute(CommandContext& ctx) {
    auto filter = build_filter(priority_, types_);
    if (!filter) {
        std::cerr << "Error: unknown --priority or --type value\n";
        return LANGLINT_EXIT_USER_ERROR;
    }

    auto files = collect_files(path_, ctx.config, *ctx.registry);
    if (!files.ok()) {
        std::cerr << "Error: " << files.error().to_string() << "\n";
        return exit_code_for(files.error());
    }

    Pipeline pipeline(*ctx.registry, nullptr, nullptr, ctx.logger);
    std::ostringstream report;
    nlohmann::json json_report = nlohmann::json::array();
    size_t total_units = 0;
    size_t failures = 0;

    for (const auto& file : files.value()) {
        auto content = read_file(file);
        if (!content.ok()) {
            ctx.logger->error(content.error().to_string());
            ++failures;
            continue;
        }
        auto parsed = pipeline.scan(content.value(), file.string());
        if (!parsed.ok()) {
            ctx.logger->error(file.string() + ": " + parsed.error().to_string());
            ++failures;
            continue;
        }

        std::vector<TranslatableUnit> units;
        for (const auto& unit : parsed.value().units) {
            if (filter->accepts(unit)) units.push_back(unit);
        }
        total_units += units.size();

        if (format_ == "json") {
            ParseResult filtered = parsed.value();
            filtered.units = units;
            json_report.push_back(nlohmann::json{{"file", file.string()}, {"result", to_json(filtered)}});
        } else if (!units.empty()) {
            print_text(report, file.string(), units);
        }
    }

    std::string output;
    if (format_ == "json") {
        output = json_report.dump(2) + "\n";
    } else {
        report << "Found " << total_units << " translatable unit(s) in "
               << files.value().size() << " file(s)\n";
        output = report.str();
    }

    if (!output_.empty()) {
        auto written = write_file(output_, output);
        if (!written.ok()) {
            std::cerr << "Error: " << written.error().to_string() << "\n";
            return exit_code_for(written.error());
        }
        ctx.logger->info("Report written to " + output_);
    } else {
        std::cout << output;
    }

    return failures > 0 ? LANGLINT_EXIT_IO_ERROR : LANGLINT_EXIT_SUCCESS;
}

void ScanCommand::print_text(std::ostream& out, const std::string& file,
                             const std::vector<TranslatableUnit>& units) const {
    out << file << " (" << units.size() << ")\n";
    for (const auto& unit : units) {
        out << "  " << unit.position.line << ":" << unit.position.column
            << " [" << to_string(unit.unit_type) << ", " << to_string(unit.priority);
        if (unit.detected_language) {
            out << ", " << *unit.detected_language;
        }
        out << "] " << unit.content << "\n";
    }
}

}  // namespace langlint::cli
