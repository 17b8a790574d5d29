#include <array>
#include <fstream>
#include <algorithm>
#include <string_view>
#include <unordered_map>
#include "file_insights/utils.hpp"
#include "file_insights/logging.hpp"
#include "file_insights/content_classifier.hpp"

namespace file_insights {

    namespace {
        using Path = std::filesystem::path;

        // A UTF-8 code point takes at most four bytes.
        constexpr std::size_t kPreviewByteLimit = kPreviewCharLimit * 4;
        constexpr double kMaxNonPrintableRatio = 0.10;

        constexpr std::array<std::string_view, 39> kBinaryExtensions = {
            ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".svg",
            ".mp3", ".wav", ".flac", ".aac", ".ogg",
            ".mp4", ".avi", ".mov", ".mkv", ".flv", ".wmv", ".webm", ".m4v", ".mpg", ".mpeg", ".3gp",
            ".zip", ".tar", ".gz", ".rar", ".7z",
            ".exe", ".dll", ".so", ".dylib",
            ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx"};

        const std::unordered_map<std::string, std::string>& mime_table() {
            static const std::unordered_map<std::string, std::string> kTable = {
                {".txt", "text/plain"},
                {".text", "text/plain"},
                {".log", "text/plain"},
                {".c", "text/plain"},
                {".h", "text/plain"},
                {".bat", "text/plain"},
                {".pl", "text/plain"},
                {".cpp", "text/x-c++src"},
                {".cc", "text/x-c++src"},
                {".cxx", "text/x-c++src"},
                {".hpp", "text/x-c++hdr"},
                {".hh", "text/x-c++hdr"},
                {".java", "text/x-java"},
                {".py", "text/x-python"},
                {".rs", "text/x-rust"},
                {".go", "text/x-go"},
                {".md", "text/markdown"},
                {".markdown", "text/markdown"},
                {".rst", "text/x-rst"},
                {".csv", "text/csv"},
                {".tsv", "text/tab-separated-values"},
                {".html", "text/html"},
                {".htm", "text/html"},
                {".css", "text/css"},
                {".js", "text/javascript"},
                {".mjs", "text/javascript"},
                {".xml", "text/xml"},
                {".yaml", "text/yaml"},
                {".yml", "text/yaml"},
                {".ics", "text/calendar"},
                {".vcf", "text/vcard"},
                {".json", "application/json"},
                {".sh", "application/x-sh"},
                {".tex", "application/x-tex"},
                {".wasm", "application/wasm"},
                {".pdf", "application/pdf"},
                {".doc", "application/msword"},
                {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
                {".xls", "application/vnd.ms-excel"},
                {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
                {".ppt", "application/vnd.ms-powerpoint"},
                {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
                {".odt", "application/vnd.oasis.opendocument.text"},
                {".zip", "application/zip"},
                {".tar", "application/x-tar"},
                {".7z", "application/x-7z-compressed"},
                {".rar", "application/vnd.rar"},
                {".exe", "application/octet-stream"},
                {".dll", "application/octet-stream"},
                {".so", "application/octet-stream"},
                {".o", "application/octet-stream"},
                {".bin", "application/octet-stream"},
                {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"},
                {".png", "image/png"},
                {".gif", "image/gif"},
                {".bmp", "image/bmp"},
                {".ico", "image/vnd.microsoft.icon"},
                {".svg", "image/svg+xml"},
                {".webp", "image/webp"},
                {".tif", "image/tiff"},
                {".tiff", "image/tiff"},
                {".mp3", "audio/mpeg"},
                {".wav", "audio/x-wav"},
                {".flac", "audio/flac"},
                {".aac", "audio/aac"},
                {".ogg", "audio/ogg"},
                {".mp4", "video/mp4"},
                {".m4v", "video/mp4"},
                {".avi", "video/x-msvideo"},
                {".mov", "video/quicktime"},
                {".mkv", "video/x-matroska"},
                {".webm", "video/webm"},
                {".wmv", "video/x-ms-wmv"},
                {".flv", "video/x-flv"},
                {".mpg", "video/mpeg"},
                {".mpeg", "video/mpeg"},
                {".3gp", "video/3gpp"}};
            return kTable;
        }

        template <std::size_t N>
        bool contains(const std::array<std::string_view, N>& values, const std::string& needle) {
            return std::any_of(values.begin(), values.end(), [&](std::string_view item) {
                return needle == item;
            });
        }

        // Strict UTF-8 decode of at most max_chars code points. Returns false on the
        // first malformed sequence that falls inside the requested prefix.
        bool decode_utf8(const std::string& bytes, std::size_t max_chars, std::u32string& out) {
            out.clear();
            std::size_t index = 0;
            while (index < bytes.size() && out.size() < max_chars) {
                const auto lead = static_cast<unsigned char>(bytes[index]);
                char32_t code_point = 0;
                std::size_t length = 0;
                char32_t minimum = 0;
                if (lead < 0x80) {
                    code_point = lead;
                    length = 1;
                } else if ((lead & 0xE0) == 0xC0) {
                    code_point = lead & 0x1F;
                    length = 2;
                    minimum = 0x80;
                } else if ((lead & 0xF0) == 0xE0) {
                    code_point = lead & 0x0F;
                    length = 3;
                    minimum = 0x800;
                } else if ((lead & 0xF8) == 0xF0) {
                    code_point = lead & 0x07;
                    length = 4;
                    minimum = 0x10000;
                } else {
                    return false;
                }

                if (index + length > bytes.size()) {
                    return false;
                }
                for (std::size_t offset = 1; offset < length; ++offset) {
                    const auto next = static_cast<unsigned char>(bytes[index + offset]);
                    if ((next & 0xC0) != 0x80) {
                        return false;
                    }
                    code_point = (code_point << 6) | (next & 0x3F);
                }
                if (code_point < minimum || code_point > 0x10FFFF ||
                    (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                    return false;
                }

                out.push_back(code_point);
                index += length;
            }
            return true;
        }

        std::u32string decode_latin1(const std::string& bytes, std::size_t max_chars) {
            std::u32string out;
            const std::size_t count = std::min(bytes.size(), max_chars);
            out.reserve(count);
            for (std::size_t index = 0; index < count; ++index) {
                out.push_back(static_cast<unsigned char>(bytes[index]));
            }
            return out;
        }

        std::string encode_utf8(const std::u32string& text) {
            std::string out;
            out.reserve(text.size());
            for (char32_t cp : text) {
                if (cp < 0x80) {
                    out.push_back(static_cast<char>(cp));
                } else if (cp < 0x800) {
                    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else if (cp < 0x10000) {
                    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else {
                    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
            }
            return out;
        }

        bool looks_binary(const std::u32string& text) {
            if (text.empty()) {
                return false;
            }

            std::size_t non_printable = 0;
            for (char32_t cp : text) {
                if (cp == 0) {
                    return true;
                }
                if (cp < 32 && cp != U'\n' && cp != U'\r' && cp != U'\t') {
                    ++non_printable;
                }
            }
            return static_cast<double>(non_printable) > kMaxNonPrintableRatio * static_cast<double>(text.size());
        }

        std::optional<std::string> read_prefix(const Path& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                return std::nullopt;
            }

            std::string buffer(kPreviewByteLimit, '\0');
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (file.bad()) {
                return std::nullopt;
            }
            buffer.resize(static_cast<std::size_t>(file.gcount()));
            return buffer;
        }
    }

    std::optional<std::string> guess_mime_type(const std::string& extension) {
        const auto& table = mime_table();
        if (auto it = table.find(extension); it != table.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool is_binary_extension(const std::string& extension) {
        return contains(kBinaryExtensions, extension);
    }

    bool is_text_mime(const std::string& mime_type) {
        return mime_type.rfind("text/", 0) == 0 || mime_type.rfind("application/json", 0) == 0;
    }

    Classification classify_content(const std::filesystem::path& path, uintmax_t size) {
        Classification result;
        const std::string extension = lowercase_extension(path);
        result.mime_type = guess_mime_type(extension);

        const bool likely_binary = is_binary_extension(extension) ||
            (result.mime_type && !is_text_mime(*result.mime_type));
        if (likely_binary) {
            result.is_binary = true;
            return result;
        }

        if (size >= kPreviewSizeLimit) {
            return result;
        }

        auto bytes = read_prefix(path);
        if (!bytes) {
            logger()->debug("Unable to read preview of {}", path.string());
            return result;
        }

        std::u32string decoded;
        if (!decode_utf8(*bytes, kPreviewCharLimit, decoded)) {
            decoded = decode_latin1(*bytes, kPreviewCharLimit);
        }

        if (looks_binary(decoded)) {
            result.is_binary = true;
            return result;
        }

        result.preview = encode_utf8(decoded);
        return result;
    }
}
