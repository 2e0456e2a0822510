/**
 * @file main.cpp
 * @brief cpaudit CLI entry point
 *
 * Reads an object export and an access rule base export, and reports the
 * objects associated with one target plus the access rules leading out of
 * and into that set.
 */

#include "cpaudit/audit.hpp"
#include "cpaudit/common.hpp"
#include "cpaudit/report.hpp"
#include "cpaudit/version.hpp"

#include <exception>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

#ifndef CPAUDIT_DEFAULT_SCHEMA_DIR
    #define CPAUDIT_DEFAULT_SCHEMA_DIR "schemas"
#endif

namespace {

void print_version()
{
    std::println("cpaudit {} ({})", cpaudit::kVersion, cpaudit::kBuildId);
    std::println("  objects schema:   {}", cpaudit::kObjectsSchema);
    std::println("  acl rules schema: {}", cpaudit::kAclRulesSchema);
}

void print_help()
{
    std::print(R"(cpaudit - firewall policy export audit

Usage: cpaudit --objs FILE --acls FILE (--target NAME | --target-uid UID) [options]

Reports the objects associated with the target (its networks and every group
that contains them) and the enabled accept rules whose source or destination
references that set.

Options:
  --objs FILE             Object export, JSON array (required)
  --acls FILE             Access rule base export, JSON array (required)
  --target NAME, -t NAME  Target object by name
  --target-uid UID        Target object by uid (for names shared by several objects)
  --format text|json      Output format (default: text)
  --schema-dir DIR        Path to schema directory (default: {})
  --no-validate           Skip JSON schema validation of the exports
  --quiet, -q             Do not print warnings about the export
  --help, -h              Show this help
  --version, -v           Show version information
)",
               CPAUDIT_DEFAULT_SCHEMA_DIR);
}

struct CliOptions
{
    std::string objects;
    std::string acls;
    std::optional<std::string> target;
    std::optional<std::string> target_uid;
    std::string schema_dir;
    cpaudit::report::OutputFormat format;
    bool validate;
    bool quiet;
    bool show_help;
    bool show_version;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> cpaudit::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            cpaudit::Error::make("MissingArgument",
                                 std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] cpaudit::Result<cpaudit::report::OutputFormat> parse_format(std::string_view value)
{
    if (value == "text") {
        return cpaudit::report::OutputFormat::kText;
    }
    if (value == "json") {
        return cpaudit::report::OutputFormat::kJson;
    }
    return std::unexpected(cpaudit::Error::make(
        "InvalidArgument", "Invalid --format value: " + std::string(value)));
}

[[nodiscard]] auto set_value_option(std::string_view arg,
                                    // CLI parsing signature is stable.
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    CliOptions& options) -> cpaudit::Result<bool>
{
    if (arg != "--objs" && arg != "--acls" && arg != "--target" && arg != "-t"
        && arg != "--target-uid" && arg != "--schema-dir" && arg != "--format") {
        return cpaudit::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (arg == "--objs") {
        options.objects = *value;
    } else if (arg == "--acls") {
        options.acls = *value;
    } else if (arg == "--target" || arg == "-t") {
        options.target = *value;
    } else if (arg == "--target-uid") {
        options.target_uid = *value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = *value;
    } else {
        auto format = parse_format(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
    }
    return cpaudit::Result<bool>{true};
}

[[nodiscard]] cpaudit::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options{.objects = std::string{},
                       .acls = std::string{},
                       .target = std::nullopt,
                       .target_uid = std::nullopt,
                       .schema_dir = CPAUDIT_DEFAULT_SCHEMA_DIR,
                       .format = cpaudit::report::OutputFormat::kText,
                       .validate = true,
                       .quiet = false,
                       .show_help = false,
                       .show_version = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            options.show_version = true;
            continue;
        }
        if (arg == "--no-validate") {
            options.validate = false;
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
            continue;
        }
        auto handled = set_value_option(arg, args, idx, options);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            skip_next = true;
            continue;
        }
        return std::unexpected(
            cpaudit::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] cpaudit::VoidResult check_required(const CliOptions& options)
{
    if (options.objects.empty() || options.acls.empty()) {
        return std::unexpected(
            cpaudit::Error::make("MissingArgument", "--objs and --acls are required"));
    }
    if (options.target.has_value() == options.target_uid.has_value()) {
        return std::unexpected(cpaudit::Error::make(
            "MissingArgument", "exactly one of --target and --target-uid is required"));
    }
    return {};
}

[[nodiscard]] int run_audit(const CliOptions& options)
{
    cpaudit::audit::AuditOptions audit_options{
        .objects_path = options.objects,
        .acls_path = options.acls,
        .target_name = options.target,
        .target_uid = options.target_uid,
        .schema_dir = options.schema_dir,
        .validate = options.validate,
    };
    auto output = cpaudit::audit::run_audit(audit_options);
    if (!output) {
        std::println(stderr, "Error: {}", output.error().message);
        return 1;
    }

    if (!options.quiet) {
        for (const auto& warning : output->warnings) {
            std::println(stderr, "Warning: {}", warning);
        }
    }

    if (options.format == cpaudit::report::OutputFormat::kJson) {
        std::println("{}", cpaudit::report::to_json(output->report).dump(2));
        return 0;
    }
    for (const auto& line : cpaudit::report::render_text(output->report)) {
        std::println("{}", line);
    }
    return 0;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        auto args = std::span<char*>(argv, static_cast<std::size_t>(argc)).subspan(1);
        auto options = parse_args(args);
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return 1;
        }
        if (options->show_help) {
            print_help();
            return 0;
        }
        if (options->show_version) {
            print_version();
            return 0;
        }
        if (auto required = check_required(*options); !required) {
            std::println(stderr, "Error: {}", required.error().message);
            print_help();
            return 1;
        }
        return run_audit(*options);
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
