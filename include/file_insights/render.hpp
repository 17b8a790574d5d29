#pragma once
#include "file_insights/types.hpp"

namespace file_insights {
    void render_scan_summary(const ScanResult& scan);
    void render_text(const AggregateResult& result);
    void render_json(const AggregateResult& result);
}
