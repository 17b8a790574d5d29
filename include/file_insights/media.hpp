#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace file_insights {
    bool is_video_extension(const std::filesystem::path& path);

    struct MediaProbeResult {
        std::optional<double> duration;
        std::optional<int> width;
        std::optional<int> height;
        std::optional<double> fps;
        std::optional<std::string> video_codec;
        std::optional<std::string> audio_codec;
        std::optional<std::string> error;
    };

    class MediaProbe {
    public:
        virtual ~MediaProbe() = default;
        virtual MediaProbeResult probe(const std::filesystem::path& path) = 0;
    };

    class FfmpegMediaProbe : public MediaProbe {
    public:
        explicit FfmpegMediaProbe(std::chrono::milliseconds timeout);
        MediaProbeResult probe(const std::filesystem::path& path) override;

    private:
        std::chrono::milliseconds timeout_;
    };
}
