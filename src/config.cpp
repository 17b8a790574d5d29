#include <cstdlib>
#include <system_error>
#include "file_insights/config.hpp"

namespace file_insights {

    namespace {
        constexpr const char* kConnectionEnvVar = "DATABASE_URL";
    }

    const std::vector<std::string>& default_exclude_patterns() {
        static const std::vector<std::string> kDefaults = {
            "**/.*",
            "**/__pycache__/**",
            "**/*.pyc",
            "**/node_modules/**",
            "**/venv/**",
            "**/.git/**",
            "**/.svn/**",
            "**/.hg/**",
            "**/.vscode/**",
            "**/.idea/**"};
        return kDefaults;
    }

    const std::vector<std::string>& effective_exclude_patterns(const ScanConfig& config) {
        if (config.exclude_patterns.empty()) {
            return default_exclude_patterns();
        }
        return config.exclude_patterns;
    }

    std::optional<std::string> validate_scan_config(const ScanConfig& config) {
        if (config.root.empty()) {
            return std::string("No directory given to scan");
        }

        std::error_code status_error;
        const auto status = std::filesystem::status(config.root, status_error);
        if (status_error) {
            return "Unable to access " + config.root.string() + ": " + status_error.message();
        }
        if (!std::filesystem::is_directory(status)) {
            return config.root.string() + " is not a directory";
        }

        if (config.extract_video_metadata && config.probe_timeout.count() <= 0) {
            return std::string("Probe timeout must be positive");
        }

        for (const auto& pattern : config.exclude_patterns) {
            if (pattern.empty()) {
                return std::string("Exclude patterns must not be empty");
            }
        }

        return std::nullopt;
    }

    std::optional<std::string> resolve_connection_string(const StoreOptions& options) {
        if (options.connection && !options.connection->empty()) {
            return options.connection;
        }
        if (const char* from_env = std::getenv(kConnectionEnvVar); from_env && *from_env) {
            return std::string(from_env);
        }
        return std::nullopt;
    }
}
