#pragma once

#include <langlint/langlint.hpp>
#include <langlint/util/text.hpp>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace langlint::cli {

/**
 * Context passed to command execution.
 * Holds the effective configuration and shared services.
 */
struct CommandContext {
    Config config;
    LoggerPtr logger;
    const ParserRegistry* registry = nullptr;
    bool verbose = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Read entire file content.
 */
inline Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "File not found", "", path.string());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Failed to open file", "", path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read file", "", path.string());
    }
    return ss.str();
}

inline Result<void> write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Failed to open file for writing", "", path.string());
    }
    file << content;
    file.flush();
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Failed to write file", "", path.string());
    }
    return Ok();
}

// Copy `path` to `path.backup`, replacing an older backup
inline Result<void> create_backup(const std::filesystem::path& path) {
    std::filesystem::path backup = path;
    backup += ".backup";
    std::error_code ec;
    std::filesystem::copy_file(path, backup,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Failed to create backup: " + ec.message(), "",
                     backup.string());
    }
    return Ok();
}

// Directory names never descended into
inline bool is_skipped_directory(const std::string& name) {
    return (!name.empty() && name[0] == '.') || name == "node_modules" || name == "target" ||
           name == "__pycache__" || name == "venv";
}

/**
 * Files under `root` handled by a registered parser and accepted by the
 * config's include/exclude patterns, sorted. A file root is returned as is.
 */
inline Result<std::vector<std::filesystem::path>> collect_files(
    const std::filesystem::path& root,
    const Config& config,
    const ParserRegistry& registry
) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Path not found", "", root.string());
    }
    if (fs::is_regular_file(root, ec)) {
        return std::vector<fs::path>{root};
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Failed to read directory: " + ec.message(), "",
                     root.string());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Error(ErrorCode::IO_ERROR, "Failed to walk directory: " + ec.message(), "",
                         root.string());
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        if (entry.is_directory(ec)) {
            if (is_skipped_directory(name)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec) || text::ends_with(name, ".backup")) {
            continue;
        }
        std::string relative = fs::relative(entry.path(), root, ec).generic_string();
        if (ec || !config.is_included(relative)) {
            continue;
        }
        if (registry.find(entry.path().string())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

// Filter from --priority / --type values; nullopt on an unknown name
inline std::optional<UnitFilter> build_filter(const std::string& priority,
                                              const std::vector<std::string>& types) {
    UnitFilter filter;
    if (!priority.empty()) {
        auto parsed = parse_priority(text::to_lower(priority));
        if (!parsed) return std::nullopt;
        filter.min_priority = *parsed;
    }
    for (const auto& name : types) {
        auto parsed = parse_unit_type(text::to_lower(name));
        if (!parsed) return std::nullopt;
        filter.unit_types.insert(*parsed);
    }
    return filter;
}

}  // namespace langlint::cli
