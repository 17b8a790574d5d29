#pragma once
#include <atomic>
#include <memory>
#include "file_insights/media.hpp"
#include "file_insights/media_enricher.hpp"
#include "file_insights/types.hpp"

namespace file_insights {
    class Scanner {
    public:
        // The probe is only consulted when video metadata extraction is enabled.
        Scanner(ScanConfig config, MediaProbe* probe);

        ScanResult scan(const std::atomic<bool>& cancel) const;
        ScanResult scan() const;

    private:
        ScanConfig config_;
        std::unique_ptr<MediaEnricher> enricher_;
    };
}
