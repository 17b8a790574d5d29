#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace file_insights {
    std::shared_ptr<spdlog::logger> init_logging(bool verbose);
    std::shared_ptr<spdlog::logger> logger();
}
