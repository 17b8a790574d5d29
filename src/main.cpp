#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include "file_insights/cli.hpp"
#include "file_insights/utils.hpp"
#include "file_insights/store.hpp"
#include "file_insights/media.hpp"
#include "file_insights/config.hpp"
#include "file_insights/errors.hpp"
#include "file_insights/render.hpp"
#include "file_insights/report.hpp"
#include "file_insights/logging.hpp"
#include "file_insights/scanner.hpp"
#include "file_insights/aggregator.hpp"

namespace {
    constexpr int kExitInterrupted = 130;

    std::atomic<bool> g_cancel_requested {false};

    void handle_interrupt(int) {
        g_cancel_requested.store(true);
    }

    int report_error(const file_insights::CliParseResult& options, const std::string& message) {
        if (options.json_output) {
            std::cout << "{\"error\":\"" << file_insights::json_escape(message) << "\"}\n";
        } else {
            file_insights::logger()->error("{}", message);
        }
        return 1;
    }

    std::unique_ptr<file_insights::Store> open_store(const file_insights::StoreOptions& options) {
        const auto connection = file_insights::resolve_connection_string(options);
        if (!connection) {
            throw file_insights::StoreError("No database connection given; pass --db-connection or set DATABASE_URL");
        }
        return std::make_unique<file_insights::SqliteStore>(*connection);
    }

    void emit_report(const file_insights::CliParseResult& options, const file_insights::AggregateResult& result) {
        if (options.json_output) {
            file_insights::render_json(result);
        } else {
            file_insights::render_text(result);
        }

        if (options.output_path) {
            if (auto error = file_insights::save_report(result, *options.output_path)) {
                file_insights::logger()->error("{}", *error);
            } else {
                file_insights::logger()->info("Insights saved to {}", *options.output_path);
            }
        }
    }

    int run_scan(const file_insights::CliParseResult& options) {
        auto log = file_insights::logger();
        const auto& config = options.scan;

        if (auto problem = file_insights::validate_scan_config(config)) {
            return report_error(options, *problem);
        }

        // The store is opened before scanning so a bad connection fails fast.
        std::unique_ptr<file_insights::Store> store;
        if (options.store.save) {
            store = open_store(options.store);
            store->initialize(options.store.rebuild);
            log->info("Database schema initialized");
        }

        std::unique_ptr<file_insights::MediaProbe> probe;
        if (config.extract_video_metadata) {
            probe = std::make_unique<file_insights::FfmpegMediaProbe>(config.probe_timeout);
            log->info("Video metadata extraction enabled");
        }

        log->info("Scanning directory: {}", config.root.string());
        file_insights::Scanner scanner(config, probe.get());
        const file_insights::ScanResult scan = scanner.scan(g_cancel_requested);

        if (!options.json_output) {
            file_insights::render_scan_summary(scan);
        }

        if (store) {
            try {
                const auto saved = store->save(scan.records);
                for (const auto& error : saved.errors) {
                    log->warn("{}", error);
                }
                log->info("Saved {} files to database", saved.saved);
                if (config.verbose && config.extract_video_metadata) {
                    log->debug("Database holds {} video files", store->count(true));
                }
            } catch (const file_insights::StoreError& e) {
                log->error("Database error: {}; continuing with insights", e.what());
            }
        }

        const auto result = file_insights::aggregate(scan.records, file_insights::Clock::now());
        emit_report(options, result);
        return scan.cancelled ? kExitInterrupted : 0;
    }

    int run_db_insights(const file_insights::CliParseResult& options) {
        auto log = file_insights::logger();
        auto store = open_store(options.store);
        store->initialize(false);

        const std::size_t total = store->count(options.query.video_only);
        log->info("Database contains {} {}files", total, options.query.video_only ? "video " : "");
        if (total == 0) {
            log->warn("No files found in database. Run 'scan --db-save' to add files.");
            return 0;
        }

        const auto records = store->query(options.query);
        log->info("Retrieved {} files", records.size());

        const auto result = file_insights::aggregate(records, file_insights::Clock::now());
        emit_report(options, result);
        return 0;
    }

    int run_db_clear(const file_insights::CliParseResult& options) {
        if (!options.confirmed) {
            return report_error(options, "Refusing to delete stored records without --yes");
        }

        auto store = open_store(options.store);
        store->initialize(false);
        const std::size_t deleted = store->delete_all();
        file_insights::logger()->info("Deleted {} files from database", deleted);
        return 0;
    }
}

int main(int argc, char* argv[]) {
    auto options = file_insights::parse_cli(argc, argv);

    if (!options.valid) {
        if (options.json_output) {
            std::cout << "{\"error\":\"" << file_insights::json_escape(options.error_message) << "\"}\n";
        } else {
            std::cerr << "\033[1;31m" << options.error_message << "\033[0m\n";
            std::cerr << "\033[1;31mUsage: " << argv[0] << " <command> [options]\033[0m\n";
        }
        return 1;
    }

    if (options.show_help) {
        file_insights::print_help(argv[0]);
        return 0;
    }

    file_insights::init_logging(options.scan.verbose);
    std::signal(SIGINT, handle_interrupt);

    try {
        switch (options.command) {
            case file_insights::Command::Scan:
                return run_scan(options);
            case file_insights::Command::DbInsights:
                return run_db_insights(options);
            case file_insights::Command::DbClear:
                return run_db_clear(options);
        }
    } catch (const file_insights::StoreError& e) {
        return report_error(options, std::string("Database error: ") + e.what());
    } catch (const file_insights::ScanError& e) {
        return report_error(options, e.what());
    }

    return 1;
}
