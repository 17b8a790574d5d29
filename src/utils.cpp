#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include "file_insights/utils.hpp"

namespace file_insights {

    namespace {
        constexpr std::array<const char*, 5> kSizeUnits = {"B", "KB", "MB", "GB", "TB"};
        constexpr unsigned kStrayBase = 0xDC00;

        std::tm local_tm(TimePoint value) {
            const std::time_t seconds = Clock::to_time_t(value);
            std::tm tm_snapshot {};
            localtime_r(&seconds, &tm_snapshot);
            return tm_snapshot;
        }

        // Length of the UTF-8 sequence starting at index, or 0 when it is malformed.
        // Overlong forms and encoded surrogates count as malformed.
        std::size_t utf8_sequence_length(const std::string& input, std::size_t index) {
            const auto lead = static_cast<unsigned char>(input[index]);
            std::size_t length = 0;
            unsigned char second_min = 0x80;
            unsigned char second_max = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                if (lead == 0xE0) {
                    second_min = 0xA0;
                } else if (lead == 0xED) {
                    second_max = 0x9F;
                }
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                if (lead == 0xF0) {
                    second_min = 0x90;
                } else if (lead == 0xF4) {
                    second_max = 0x8F;
                }
            } else {
                return 0;
            }
            if (index + length > input.size()) {
                return 0;
            }
            const auto second = static_cast<unsigned char>(input[index + 1]);
            if (second < second_min || second > second_max) {
                return 0;
            }
            for (std::size_t offset = 2; offset < length; ++offset) {
                const auto next = static_cast<unsigned char>(input[index + offset]);
                if ((next & 0xC0) != 0x80) {
                    return 0;
                }
            }
            return length;
        }

        // Three-byte UTF-8 form of U+DC00 + byte.
        void append_stray_byte(std::string& out, unsigned char byte) {
            out += static_cast<char>(0xED);
            out += static_cast<char>(byte < 0xC0 ? 0xB2 : 0xB3);
            out += static_cast<char>(0x80 | (byte & 0x3F));
        }

        bool is_stray_sequence(const std::string& input, std::size_t index) {
            if (index + 3 > input.size()) {
                return false;
            }
            const auto lead = static_cast<unsigned char>(input[index]);
            const auto second = static_cast<unsigned char>(input[index + 1]);
            const auto third = static_cast<unsigned char>(input[index + 2]);
            return lead == 0xED && (second == 0xB2 || second == 0xB3) && (third & 0xC0) == 0x80;
        }
    }

    std::string format_size(uintmax_t size) {
        if (size < 1024) {
            return std::to_string(size) + " " + kSizeUnits.front();
        }
        double scaled = static_cast<double>(size) / 1024.0;
        std::size_t unit = 1;
        for (; unit + 1 < kSizeUnits.size() && scaled >= 1024.0; ++unit) {
            scaled /= 1024.0;
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << scaled << " " << kSizeUnits[unit];
        return oss.str();
    }

    std::string format_time(TimePoint value) {
        const std::tm tm_snapshot = local_tm(value);
        std::ostringstream oss;
        oss << std::put_time(&tm_snapshot, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    std::string format_date(TimePoint value) {
        const std::tm tm_snapshot = local_tm(value);
        std::ostringstream oss;
        oss << std::put_time(&tm_snapshot, "%Y-%m-%d");
        return oss.str();
    }

    std::optional<TimePoint> parse_time(const std::string& text) {
        std::tm tm_snapshot {};
        std::istringstream iss(text);
        iss >> std::get_time(&tm_snapshot, "%Y-%m-%d %H:%M:%S");
        if (iss.fail()) {
            return std::nullopt;
        }
        tm_snapshot.tm_isdst = -1;
        const std::time_t seconds = std::mktime(&tm_snapshot);
        if (seconds == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return Clock::from_time_t(seconds);
    }

    TimePoint to_time_point(const timespec& value) {
        const auto since_epoch = std::chrono::seconds(value.tv_sec) + std::chrono::nanoseconds(value.tv_nsec);
        return TimePoint(std::chrono::duration_cast<Clock::duration>(since_epoch));
    }

    std::string to_lowercase(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string lowercase_extension(const std::filesystem::path& path) {
        return to_lowercase(path.extension().string());
    }

    std::string json_escape(const std::string& input) {
        std::ostringstream oss;
        std::size_t index = 0;
        while (index < input.size()) {
            const auto c = static_cast<unsigned char>(input[index]);
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7F) {
                        oss << "\\u"
                            << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c)
                            << std::dec << std::nouppercase;
                    } else if (c < 0x80) {
                        oss << static_cast<char>(c);
                    } else if (std::size_t length = utf8_sequence_length(input, index); length > 0) {
                        oss << input.substr(index, length);
                        index += length;
                        continue;
                    } else {
                        // Stray byte of a non UTF-8 name, written as a lone low surrogate.
                        oss << "\\u"
                            << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                            << (kStrayBase + c)
                            << std::dec << std::nouppercase;
                    }
            }
            ++index;
        }
        return oss.str();
    }

    std::string escape_stray_bytes(const std::string& input) {
        std::string out;
        out.reserve(input.size());
        std::size_t index = 0;
        while (index < input.size()) {
            const auto c = static_cast<unsigned char>(input[index]);
            if (c < 0x80) {
                out += static_cast<char>(c);
                ++index;
            } else if (std::size_t length = utf8_sequence_length(input, index); length > 0) {
                out.append(input, index, length);
                index += length;
            } else {
                append_stray_byte(out, c);
                ++index;
            }
        }
        return out;
    }

    std::string restore_stray_bytes(const std::string& input) {
        std::string out;
        out.reserve(input.size());
        std::size_t index = 0;
        while (index < input.size()) {
            if (is_stray_sequence(input, index)) {
                const auto second = static_cast<unsigned char>(input[index + 1]);
                const auto third = static_cast<unsigned char>(input[index + 2]);
                out += static_cast<char>((second == 0xB2 ? 0x80 : 0xC0) | (third & 0x3F));
                index += 3;
            } else {
                out += input[index];
                ++index;
            }
        }
        return out;
    }
}
