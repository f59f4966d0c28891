/**
 * @file main.cpp
 * @brief tfmigrate CLI entry point
 *
 * Commands:
 *   migrate   - Migrate configuration files and/or a state document from v4 to v5
 *   version   - Show version information
 */

#include "tfmigrate/require_cpp23.hpp"

#include "tfmigrate/common.hpp"
#include "tfmigrate/diagnostics.hpp"
#include "tfmigrate/hcl.hpp"
#include "tfmigrate/migrate.hpp"
#include "tfmigrate/print.hpp"
#include "tfmigrate/rules.hpp"
#include "tfmigrate/state.hpp"
#include "tfmigrate/version.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

namespace fs = std::filesystem;

void print_version()
{
    std::println("tfmigrate {} ({})", tfmigrate::kVersion, tfmigrate::kBuildId);
    std::println("  provider: {} -> {}", tfmigrate::kSourceVersion, tfmigrate::kTargetVersion);
    std::println("  rules:    {}", tfmigrate::kRulesSchemaVersion);
}

void print_help()
{
    std::print(R"(tfmigrate - Cloudflare Terraform provider v4 to v5 migration

Usage: tfmigrate <command> [options]

Commands:
  migrate     Migrate configuration files and/or a state document
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'tfmigrate <command> --help' for command-specific options.
)");
}

void print_migrate_help()
{
    std::print(R"(Usage: tfmigrate migrate [options]

Migrate configuration files and/or a state document from v4 to v5

Options:
  --config-dir DIR          Directory containing .tf files (not searched recursively)
  --state-file FILE         Terraform state document
  --output-dir DIR          Write migrated .tf files here instead of in place
  --output-state FILE       Write the migrated state here instead of in place
  --rules FILE              Merge rules file (default: built-in split tunnel rules)
  --resources KINDS         Comma-separated resource kinds to migrate (default: all)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --backup                  Keep <file>.backup copies of files rewritten in place (default)
  --no-backup               Do not keep <file>.backup copies of files rewritten in place
  --dry-run                 Report what would change without writing anything
  --help, -h                Show this help

At least one of --config-dir and --state-file is required.
)");
}

struct MigrateOptions
{
    std::string config_dir;
    std::string state_file;
    std::string output_dir;
    std::string output_state;
    std::string rules;
    std::string resources;
    std::string schema_dir;
    bool backup;
    bool dry_run;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> tfmigrate::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            tfmigrate::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_migrate_option(std::string_view arg,
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      MigrateOptions& options,
                                      bool& skip_next) -> tfmigrate::Result<bool>
{
    struct ValueOption
    {
        std::string_view name;
        std::string MigrateOptions::*field;
    };
    static constexpr ValueOption kValueOptions[] = {
        {"--config-dir", &MigrateOptions::config_dir},
        {"--state-file", &MigrateOptions::state_file},
        {"--output-dir", &MigrateOptions::output_dir},
        {"--output-state", &MigrateOptions::output_state},
        {"--rules", &MigrateOptions::rules},
        {"--resources", &MigrateOptions::resources},
        {"--schema-dir", &MigrateOptions::schema_dir},
    };

    for (const auto& option : kValueOptions) {
        if (arg != option.name) {
            continue;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.*option.field = *value;
        skip_next = true;
        return tfmigrate::Result<bool>{true};
    }
    if (arg == "--backup") {
        options.backup = true;
        return tfmigrate::Result<bool>{true};
    }
    if (arg == "--no-backup") {
        options.backup = false;
        return tfmigrate::Result<bool>{true};
    }
    if (arg == "--dry-run") {
        options.dry_run = true;
        return tfmigrate::Result<bool>{true};
    }
    return tfmigrate::Result<bool>{false};
}

[[nodiscard]] tfmigrate::Result<MigrateOptions> parse_migrate_args(std::span<char*> args)
{
    MigrateOptions options{.config_dir = std::string{},
                           .state_file = std::string{},
                           .output_dir = std::string{},
                           .output_state = std::string{},
                           .rules = std::string{},
                           .resources = std::string{},
                           .schema_dir = "schemas",
                           .backup = true,
                           .dry_run = false,
                           .show_help = false};
    bool skip_next = false;
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_migrate_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(tfmigrate::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] std::vector<std::string> split_kinds(std::string_view list)
{
    std::vector<std::string> kinds;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto kind = tfmigrate::common::trim(list.substr(0, comma));
        if (!kind.empty()) {
            kinds.emplace_back(kind);
        }
        list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
    }
    return kinds;
}

[[nodiscard]] tfmigrate::VoidResult ensure_directory(const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(tfmigrate::Error::make(
            "IOError", "Failed to create directory " + dir.string() + ": " + ec.message()));
    }
    return {};
}

[[nodiscard]] tfmigrate::Result<std::vector<fs::path>> discover_config_files(const fs::path& dir)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(tfmigrate::Error::make(
            "IOError", "Failed to read config directory " + dir.string() + ": " + ec.message()));
    }
    std::vector<fs::path> files;
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".tf") {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files);
    return files;
}

void report_diagnostics(const std::vector<tfmigrate::reclass::Diagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        std::println(stderr, "warning: {}", diagnostic.message);
    }
}

/**
 * Write migrated text, keeping a backup of the original when rewriting in place.
 */
[[nodiscard]] tfmigrate::VoidResult write_output(const fs::path& source,
                                                 const fs::path& destination,
                                                 std::string_view original,
                                                 std::string_view migrated,
                                                 bool backup)
{
    if (backup && destination == source) {
        fs::path backup_path = source;
        backup_path += ".backup";
        if (auto saved = tfmigrate::common::write_text_file(backup_path, original); !saved) {
            return saved;
        }
    }
    return tfmigrate::common::write_text_file(destination, migrated);
}

[[nodiscard]] int migrate_config_dir(const MigrateOptions& options,
                                     const tfmigrate::migrate::Registry& registry)
{
    auto files = discover_config_files(options.config_dir);
    if (!files) {
        std::println(stderr, "Error: {}", files.error().message);
        return 1;
    }
    if (!options.output_dir.empty() && !options.dry_run) {
        if (auto created = ensure_directory(options.output_dir); !created) {
            std::println(stderr, "Error: {}", created.error().message);
            return 1;
        }
    }

    std::size_t changed = 0;
    for (const auto& path : *files) {
        auto text = tfmigrate::common::read_text_file(path);
        if (!text) {
            std::println(stderr, "Error: {}", text.error().message);
            return 1;
        }
        auto unit = tfmigrate::hcl::parse(*text, path.filename().string());
        if (!unit) {
            std::println(stderr, "Error: {}", unit.error().message);
            return 1;
        }

        tfmigrate::migrate::MigrationContext ctx;
        if (auto migrated = tfmigrate::migrate::migrate_config(*unit, registry, ctx); !migrated) {
            std::println(stderr, "Error: {}", migrated.error().message);
            return 1;
        }
        report_diagnostics(ctx.diagnostics);

        std::string output = tfmigrate::hcl::write(*unit);
        fs::path destination =
            options.output_dir.empty() ? path : fs::path(options.output_dir) / path.filename();
        const bool modified = output != *text;
        if (modified) {
            ++changed;
        }
        if (options.dry_run) {
            std::println("  {} {}", modified ? "would update" : "unchanged", path.string());
            continue;
        }
        if (!modified && destination == path) {
            continue;
        }
        if (auto written = write_output(path, destination, *text, output, options.backup); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
        std::println("  wrote {}", destination.string());
    }

    std::println("[migrate] config: {} file(s), {} changed", files->size(), changed);
    return 0;
}

[[nodiscard]] int migrate_state_file(const MigrateOptions& options,
                                     const tfmigrate::migrate::Registry& registry)
{
    const fs::path path(options.state_file);
    auto text = tfmigrate::common::read_text_file(path);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return 1;
    }
    auto document = tfmigrate::state::parse_state(*text);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return 1;
    }
    if (auto valid = tfmigrate::state::validate_state(*document, options.schema_dir); !valid) {
        std::println(stderr, "Error: state validation failed: {}", valid.error().message);
        return 1;
    }

    tfmigrate::migrate::MigrationContext ctx;
    if (auto migrated = tfmigrate::migrate::migrate_state(*document, registry, ctx); !migrated) {
        std::println(stderr, "Error: {}", migrated.error().message);
        return 1;
    }
    report_diagnostics(ctx.diagnostics);

    std::string output = tfmigrate::state::dump_state(*document);
    fs::path destination = options.output_state.empty() ? path : fs::path(options.output_state);
    if (options.dry_run) {
        std::println("  would update {}", path.string());
    } else {
        if (auto written = write_output(path, destination, *text, output, options.backup); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
        std::println("  wrote {}", destination.string());
    }

    std::println("[migrate] state: {} resource(s) migrated, {} warning(s)", ctx.resources_migrated,
                 ctx.diagnostics.size());
    return 0;
}

[[nodiscard]] int run_migrate(const MigrateOptions& options)
{
    tfmigrate::reclass::MergeRules rules = tfmigrate::reclass::split_tunnel_rules();
    if (!options.rules.empty()) {
        auto loaded = tfmigrate::reclass::load_rules(options.rules, options.schema_dir);
        if (!loaded) {
            std::println(stderr, "Error: {}", loaded.error().message);
            return 1;
        }
        rules = std::move(*loaded);
    }
    auto registry = tfmigrate::migrate::default_registry(rules, split_kinds(options.resources));
    if (!registry) {
        std::println(stderr, "Error: {}", registry.error().message);
        return 1;
    }

    if (!options.config_dir.empty()) {
        if (int status = migrate_config_dir(options, *registry); status != 0) {
            return status;
        }
    }
    if (!options.state_file.empty()) {
        if (int status = migrate_state_file(options, *registry); status != 0) {
            return status;
        }
    }
    return 0;
}

int cmd_migrate(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_migrate_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_migrate_help();
        return 0;
    }
    if (options->config_dir.empty() && options->state_file.empty()) {
        std::println(stderr, "Error: --config-dir or --state-file is required");
        print_migrate_help();
        return 1;
    }
    return run_migrate(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }
        if (cmd == "migrate") {
            return cmd_migrate(argc - 2, argv + 2);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
