#include <iostream>
#include <stdexcept>
#include <vector>
#include "file_insights/cli.hpp"
#include "file_insights/utils.hpp"

namespace file_insights {

    namespace {
        constexpr double kMaxProbeTimeoutSeconds = 86400.0;

        void append_usage(std::ostream& out, const std::string& program_name) {
            out << "Usage: " << program_name << " <command> [options]\n"
                << "\n"
                << "Inventory a directory tree and report aggregate insights:\n"
                << "  - File counts, sizes, oldest and newest files\n"
                << "  - Extension breakdown and file age distribution\n"
                << "  - Video metadata (duration, resolution, fps, codecs) via FFmpeg\n"
                << "  - Duplicate detection by SHA-256 checksum\n"
                << "\n"
                << "Commands:\n"
                << "  scan [DIR]             Scan DIR (default: current directory)\n"
                << "  db-insights            Report on records stored in the database\n"
                << "  db-clear               Delete every stored record\n"
                << "\n"
                << "Scan options:\n"
                << "  -o, --output FILE      Save the report as JSON to FILE\n"
                << "  --recursive            Descend into subdirectories (default)\n"
                << "  --no-recursive         Only scan the top-level directory\n"
                << "  -e, --exclude PATTERN  Glob pattern to exclude (repeatable)\n"
                << "  --video-metadata       Extract video metadata\n"
                << "  --no-video-metadata    Skip video metadata (default)\n"
                << "  --checksums            Compute SHA-256 checksums and report duplicates\n"
                << "  --probe-timeout SEC    Per-file video probe timeout (default: 10)\n"
                << "  --db-save              Save records to the database\n"
                << "  --rebuild-db           Drop and recreate the database schema\n"
                << "  -v, --verbose          Print debug information\n"
                << "\n"
                << "db-insights options:\n"
                << "  --limit N              Maximum number of records to load (default: 1000)\n"
                << "  --video-only           Only load video records\n"
                << "  -e, --extension EXT    Only load records with EXT (repeatable)\n"
                << "  -o, --output FILE      Save the report as JSON to FILE\n"
                << "\n"
                << "db-clear options:\n"
                << "  --yes                  Confirm deletion\n"
                << "\n"
                << "Common options:\n"
                << "  --db-connection STR    Database file (default: DATABASE_URL)\n"
                << "  --json                 Print the report as JSON instead of colored text\n"
                << "  -h, --help             Show this help message and exit\n";
        }

        std::optional<Command> parse_command(const std::string& name) {
            if (name == "scan") {
                return Command::Scan;
            }
            if (name == "db-insights") {
                return Command::DbInsights;
            }
            if (name == "db-clear") {
                return Command::DbClear;
            }
            return std::nullopt;
        }

        std::string normalize_extension(const std::string& value) {
            std::string extension = to_lowercase(value);
            if (!extension.empty() && extension.front() != '.') {
                extension.insert(extension.begin(), '.');
            }
            return extension;
        }

        class ArgumentCursor {
        public:
            ArgumentCursor(int argc, char* argv[]) : argc_(argc), argv_(argv) {}

            bool done() const {
                return index_ >= argc_;
            }

            std::string next() {
                return argv_[index_++];
            }

            std::optional<std::string> value() {
                if (done()) {
                    return std::nullopt;
                }
                return next();
            }

        private:
            int argc_;
            char** argv_;
            int index_ = 1;
        };

        bool fail(CliParseResult& result, const std::string& message) {
            result.valid = false;
            result.error_message = message;
            return false;
        }

        // Options accepted by every command; sets consumed when the argument is one of them.
        bool parse_common(const std::string& argument, ArgumentCursor& cursor, CliParseResult& result, bool& consumed) {
            consumed = true;
            if (argument == "--json") {
                result.json_output = true;
                return true;
            }
            if (argument == "--db-connection") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for --db-connection");
                }
                result.store.connection = *value;
                return true;
            }
            consumed = false;
            return true;
        }

        bool parse_scan_option(const std::string& argument, ArgumentCursor& cursor, CliParseResult& result) {
            if (argument == "-o" || argument == "--output") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for " + argument);
                }
                result.output_path = *value;
            } else if (argument == "--recursive") {
                result.scan.recursive = true;
            } else if (argument == "--no-recursive") {
                result.scan.recursive = false;
            } else if (argument == "-e" || argument == "--exclude") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for " + argument);
                }
                result.scan.exclude_patterns.push_back(*value);
            } else if (argument == "--video-metadata") {
                result.scan.extract_video_metadata = true;
            } else if (argument == "--no-video-metadata") {
                result.scan.extract_video_metadata = false;
            } else if (argument == "--checksums") {
                result.scan.compute_checksums = true;
            } else if (argument == "--probe-timeout") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for --probe-timeout");
                }
                double seconds = 0.0;
                try {
                    std::size_t consumed = 0;
                    seconds = std::stod(*value, &consumed);
                    if (consumed != value->size()) {
                        return fail(result, "Invalid probe timeout: " + *value);
                    }
                } catch (const std::logic_error&) {
                    return fail(result, "Invalid probe timeout: " + *value);
                }
                if (!(seconds > 0.0)) {
                    return fail(result, "Probe timeout must be positive: " + *value);
                }
                if (seconds > kMaxProbeTimeoutSeconds) {
                    return fail(result, "Probe timeout must not exceed 86400 seconds: " + *value);
                }
                result.scan.probe_timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
            } else if (argument == "--db-save") {
                result.store.save = true;
            } else if (argument == "--rebuild-db") {
                result.store.rebuild = true;
            } else if (argument == "-v" || argument == "--verbose") {
                result.scan.verbose = true;
            } else {
                return fail(result, "Unknown option for scan: " + argument);
            }
            return true;
        }

        bool parse_insights_option(const std::string& argument, ArgumentCursor& cursor, CliParseResult& result) {
            if (argument == "--limit") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for --limit");
                }
                try {
                    std::size_t consumed = 0;
                    const unsigned long long limit = std::stoull(*value, &consumed);
                    if (consumed != value->size() || value->front() == '-') {
                        return fail(result, "Invalid limit: " + *value);
                    }
                    result.query.limit = static_cast<std::size_t>(limit);
                } catch (const std::logic_error&) {
                    return fail(result, "Invalid limit: " + *value);
                }
            } else if (argument == "--video-only") {
                result.query.video_only = true;
            } else if (argument == "-e" || argument == "--extension") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for " + argument);
                }
                result.query.extensions.push_back(normalize_extension(*value));
            } else if (argument == "-o" || argument == "--output") {
                auto value = cursor.value();
                if (!value) {
                    return fail(result, "Missing value for " + argument);
                }
                result.output_path = *value;
            } else {
                return fail(result, "Unknown option for db-insights: " + argument);
            }
            return true;
        }
    }

    void print_help(const std::string& program_name) {
        append_usage(std::cout, program_name);
    }

    CliParseResult parse_cli(int argc, char* argv[]) {
        CliParseResult result;
        ArgumentCursor cursor(argc, argv);
        std::optional<Command> command;
        bool literal_mode = false;
        std::vector<std::string> positional;

        while (!cursor.done()) {
            const std::string argument = cursor.next();

            if (!literal_mode) {
                if (argument == "--") {
                    literal_mode = true;
                    continue;
                }
                if (argument == "-h" || argument == "--help" || argument == "-help") {
                    result.show_help = true;
                    continue;
                }
            }

            if (!command) {
                if (!literal_mode && !argument.empty() && argument.front() == '-') {
                    if (argument == "--json") {
                        result.json_output = true;
                        continue;
                    }
                    fail(result, "Unknown option: " + argument);
                    return result;
                }
                command = parse_command(argument);
                if (!command) {
                    fail(result, "Unknown command: " + argument);
                    return result;
                }
                result.command = *command;
                continue;
            }

            if (!literal_mode && !argument.empty() && argument.front() == '-') {
                bool consumed = false;
                if (!parse_common(argument, cursor, result, consumed)) {
                    return result;
                }
                if (consumed) {
                    continue;
                }

                bool ok = false;
                switch (*command) {
                    case Command::Scan:
                        ok = parse_scan_option(argument, cursor, result);
                        break;
                    case Command::DbInsights:
                        ok = parse_insights_option(argument, cursor, result);
                        break;
                    case Command::DbClear:
                        if (argument == "--yes" || argument == "-y") {
                            result.confirmed = true;
                            ok = true;
                        } else {
                            ok = fail(result, "Unknown option for db-clear: " + argument);
                        }
                        break;
                }
                if (!ok) {
                    return result;
                }
                continue;
            }

            positional.push_back(argument);
        }

        if (result.show_help) {
            return result;
        }

        if (!command) {
            result.show_help = true;
            return result;
        }

        if (*command == Command::Scan) {
            if (positional.size() > 1) {
                fail(result, "Unexpected extra argument: " + positional[1]);
            } else if (!positional.empty()) {
                result.scan.root = positional.front();
            }
        } else if (!positional.empty()) {
            fail(result, "Unexpected argument: " + positional.front());
        }

        return result;
    }
}
