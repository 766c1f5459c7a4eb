#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/fix_command.hpp"
#include "commands/scan_command.hpp"
#include "commands/translate_command.hpp"

#include <map>

using namespace langlint;
using namespace langlint::cli;

namespace {

Result<Config> load_config(const std::string& explicit_path) {
    Result<Config> config = explicit_path.empty()
        ? Config::find_and_load(std::filesystem::current_path())
        : Config::load_from_file(explicit_path);
    if (!config.ok()) {
        return config;
    }
    Config effective = config.value();
    effective.apply_env();
    return effective;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"langlint: translate comments and docstrings in source files"};
    app.set_version_flag("--version", LANGLINT_VERSION);
    app.require_subcommand(1);

    bool verbose = false;
    std::string config_path;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_option("-c,--config", config_path, "Config file (default: .langlint.json)")
        ->type_name("<file>");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ScanCommand>());
    commands.push_back(std::make_unique<TranslateCommand>());
    commands.push_back(std::make_unique<FixCommand>());

    std::map<CLI::App*, Command*> by_subcommand;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        by_subcommand[sub] = command.get();
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? LANGLINT_EXIT_SUCCESS : LANGLINT_EXIT_USER_ERROR;
    }

    auto logger = std::make_shared<ConsoleLogger>(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    auto config = load_config(config_path);
    if (!config.ok()) {
        std::cerr << "Error: " << config.error().to_string() << "\n";
        return exit_code_for(config.error());
    }

    ParserRegistry registry = ParserRegistry::with_defaults();

    CommandContext ctx;
    ctx.config = config.value();
    ctx.logger = logger;
    ctx.registry = &registry;
    ctx.verbose = verbose;

    for (CLI::App* sub : app.get_subcommands()) {
        auto it = by_subcommand.find(sub);
        if (it != by_subcommand.end()) {
            try {
                return it->second->execute(ctx);
            } catch (const std::exception& e) {
                std::cerr << "Internal error: " << e.what() << "\n";
                return LANGLINT_EXIT_INTERNAL;
            }
        }
    }

    std::cerr << "Run 'langlint --help' for available commands.\n";
    return LANGLINT_EXIT_USER_ERROR;
}
