#include <array>
#include <memory>
#include <cstring>
#include <algorithm>
#include <string_view>
#include "file_insights/utils.hpp"
#include "file_insights/media.hpp"

extern "C" {
    #include <libavutil/avutil.h>
    #include <libavutil/error.h>
    #include <libavcodec/avcodec.h>
    #include <libavformat/avformat.h>
}

namespace file_insights {

    namespace {
        using Path = std::filesystem::path;
        using SteadyClock = std::chrono::steady_clock;

        constexpr std::array<std::string_view, 11> kVideoExtensions = {
            ".mp4", ".avi", ".mkv", ".mov", ".flv", ".wmv", ".webm", ".m4v", ".mpg", ".mpeg", ".3gp"};

        struct FormatContextDeleter {
            void operator()(AVFormatContext* ctx) const noexcept {
                if (!ctx) {
                    return;
                }
                AVFormatContext* to_close = ctx;
                avformat_close_input(&to_close);
            }
        };

        using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;

        struct ProbeDeadline {
            SteadyClock::time_point expires_at;
            bool expired = false;
        };

        // libavformat polls this during blocking reads; non-zero aborts the call.
        int interrupt_after_deadline(void* opaque) {
            auto* deadline = static_cast<ProbeDeadline*>(opaque);
            if (SteadyClock::now() >= deadline->expires_at) {
                deadline->expired = true;
                return 1;
            }
            return 0;
        }

        std::string describe_av_error(int code) {
            std::array<char, AV_ERROR_MAX_STRING_SIZE> buffer {};
            if (av_strerror(code, buffer.data(), buffer.size()) < 0) {
                return "error code " + std::to_string(code);
            }
            return std::string(buffer.data());
        }

        FormatContextPtr open_media_file(const Path& path, ProbeDeadline& deadline, std::string& error) {
            AVFormatContext* raw = avformat_alloc_context();
            if (!raw) {
                error = "unable to allocate format context";
                return nullptr;
            }
            raw->interrupt_callback.callback = &interrupt_after_deadline;
            raw->interrupt_callback.opaque = &deadline;

            const std::string native_path = path.string();
            // On failure avformat_open_input frees the context itself.
            if (int rc = avformat_open_input(&raw, native_path.c_str(), nullptr, nullptr); rc != 0) {
                error = describe_av_error(rc);
                return nullptr;
            }
            FormatContextPtr context(raw);
            if (int rc = avformat_find_stream_info(context.get(), nullptr); rc < 0) {
                error = describe_av_error(rc);
                return nullptr;
            }
            return context;
        }

        AVStream* find_stream(AVFormatContext* context, AVMediaType type) {
            for (unsigned int idx = 0; idx < context->nb_streams; ++idx) {
                AVStream* candidate = context->streams[idx];
                if (candidate->codecpar && candidate->codecpar->codec_type == type) {
                    return candidate;
                }
            }
            return nullptr;
        }

        std::optional<std::string> codec_name(const AVStream* stream) {
            if (!stream || !stream->codecpar) {
                return std::nullopt;
            }
            const char* name = avcodec_get_name(stream->codecpar->codec_id);
            if (!name || std::strlen(name) == 0) {
                return std::nullopt;
            }
            return std::string(name);
        }
    }

    bool is_video_extension(const Path& path) {
        const std::string lowered = lowercase_extension(path);
        return std::any_of(kVideoExtensions.begin(), kVideoExtensions.end(), [&](std::string_view item) {
            return lowered == item;
        });
    }

    FfmpegMediaProbe::FfmpegMediaProbe(std::chrono::milliseconds timeout)
        : timeout_(timeout) {
        // Corrupt containers are expected; failures are reported through the result.
        av_log_set_level(AV_LOG_QUIET);
    }

    MediaProbeResult FfmpegMediaProbe::probe(const Path& path) {
        MediaProbeResult result;
        ProbeDeadline deadline {SteadyClock::now() + timeout_};

        std::string error;
        auto context = open_media_file(path, deadline, error);
        if (!context) {
            if (deadline.expired) {
                result.error = "probe timed out after " + std::to_string(timeout_.count()) + " ms";
            } else {
                result.error = error;
            }
            return result;
        }

        AVStream* video = find_stream(context.get(), AVMEDIA_TYPE_VIDEO);
        if (!video) {
            result.error = "no video stream";
            return result;
        }

        if (context->duration != AV_NOPTS_VALUE && context->duration >= 0) {
            result.duration = static_cast<double>(context->duration) / AV_TIME_BASE;
        }

        result.width = video->codecpar->width;
        result.height = video->codecpar->height;

        const AVRational rate = av_guess_frame_rate(context.get(), video, nullptr);
        if (rate.num > 0 && rate.den > 0) {
            result.fps = av_q2d(rate);
        }

        result.video_codec = codec_name(video);
        result.audio_codec = codec_name(find_stream(context.get(), AVMEDIA_TYPE_AUDIO));
        return result;
    }
}
