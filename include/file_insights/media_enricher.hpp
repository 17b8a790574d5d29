#pragma once
#include "file_insights/media.hpp"
#include "file_insights/types.hpp"

namespace file_insights {
    // Anything smaller cannot hold a usable container.
    constexpr uintmax_t kMinProbeSize = 10 * 1024;

    class MediaEnricher {
    public:
        MediaEnricher(MediaProbe& probe, bool verbose);

        FileRecord enrich(FileRecord record) const;

    private:
        MediaProbe& probe_;
        bool verbose_;
    };
}
