#include <spdlog/sinks/stdout_color_sinks.h>
#include "file_insights/logging.hpp"

namespace file_insights {

    namespace {
        constexpr const char* kLoggerName = "file_insights";
        constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] %v";

        std::shared_ptr<spdlog::logger> create_logger() {
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_pattern(kPattern);
            created->set_level(spdlog::level::info);
            return created;
        }
    }

    std::shared_ptr<spdlog::logger> init_logging(bool verbose) {
        auto instance = logger();
        instance->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        return instance;
    }

    std::shared_ptr<spdlog::logger> logger() {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        return create_logger();
    }
}
