#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>
#include <stdexcept>
#include <fstream>
#include <sstream>
#include <json/json.h>
#include "file_insights/utils.hpp"
#include "file_insights/report.hpp"

namespace file_insights {

    namespace {
        const char* const kHexDigits = "0123456789abcdef";

        // Names are stored with stray bytes mapped to U+DC80..U+DCFF.
        Json::Value text_value(const std::string& value) {
            return Json::Value(escape_stray_bytes(value));
        }

        Json::Value size_value(uintmax_t value) {
            return Json::Value(static_cast<Json::UInt64>(value));
        }

        Json::Value double_value(double value) {
            if (!std::isfinite(value)) {
                return Json::Value(Json::nullValue);
            }
            return Json::Value(value);
        }

        Json::Value optional_text_value(const std::optional<std::string>& value) {
            return value ? text_value(*value) : Json::Value(Json::nullValue);
        }

        Json::Value optional_double_value(const std::optional<double>& value) {
            return value ? double_value(*value) : Json::Value(Json::nullValue);
        }

        // The writer emits UTF-8 as is, so the surrogates are turned into \udcXX escapes here.
        std::string escape_surrogates(const std::string& json) {
            std::string out;
            out.reserve(json.size());
            std::size_t index = 0;
            while (index < json.size()) {
                const auto lead = static_cast<unsigned char>(json[index]);
                if (lead == 0xED && index + 2 < json.size()) {
                    const auto second = static_cast<unsigned char>(json[index + 1]);
                    const auto third = static_cast<unsigned char>(json[index + 2]);
                    if ((second == 0xB2 || second == 0xB3) && (third & 0xC0) == 0x80) {
                        const unsigned low = ((second == 0xB2 ? 0x80u : 0xC0u) | (third & 0x3Fu));
                        out += "\\udc";
                        out += kHexDigits[low >> 4];
                        out += kHexDigits[low & 0x0F];
                        index += 3;
                        continue;
                    }
                }
                out += json[index];
                ++index;
            }
            return out;
        }

        std::string format_resolution(const Resolution& resolution) {
            return std::to_string(resolution.width) + "x" + std::to_string(resolution.height);
        }

        Json::Value write_video_metadata(const VideoMetadata& video) {
            Json::Value node(Json::objectValue);
            node["duration"] = optional_double_value(video.duration);
            node["resolution"] = video.resolution ? Json::Value(format_resolution(*video.resolution))
                                                  : Json::Value(Json::nullValue);
            node["fps"] = optional_double_value(video.fps);
            node["video_codec"] = optional_text_value(video.video_codec);
            node["audio_codec"] = optional_text_value(video.audio_codec);
            return node;
        }

        Json::Value write_tree(const FileTreeDirectory& directory) {
            Json::Value children(Json::objectValue);
            for (const auto& entry : directory.children) {
                Json::Value node(Json::objectValue);
                if (const auto* child = std::get_if<FileTreeDirectory>(&entry.node)) {
                    node["type"] = "directory";
                    node["children"] = write_tree(*child);
                } else {
                    const auto& leaf = std::get<FileTreeLeaf>(entry.node);
                    node["type"] = "file";
                    node["size"] = size_value(leaf.size);
                    node["extension"] = text_value(leaf.extension);
                    node["is_video"] = leaf.is_video;
                    if (leaf.video) {
                        node["video"] = write_video_metadata(*leaf.video);
                    }
                }
                children[escape_stray_bytes(entry.name)] = std::move(node);
            }
            return children;
        }

        Json::Value write_video_stats(const VideoStats& stats) {
            Json::Value node(Json::objectValue);
            node["total_videos"] = size_value(stats.total_videos);
            node["videos_with_metadata"] = size_value(stats.videos_with_metadata);
            node["total_duration"] = double_value(stats.total_duration);
            node["average_duration"] = double_value(stats.average_duration);

            Json::Value resolutions(Json::arrayValue);
            for (const auto& entry : stats.resolution_counts) {
                Json::Value item(Json::objectValue);
                item["resolution"] = entry.resolution;
                item["count"] = size_value(entry.count);
                resolutions.append(std::move(item));
            }
            node["resolution_counts"] = std::move(resolutions);

            Json::Value codecs(Json::arrayValue);
            for (const auto& entry : stats.codec_counts) {
                Json::Value item(Json::objectValue);
                item["codec"] = optional_text_value(entry.codec);
                item["count"] = size_value(entry.count);
                codecs.append(std::move(item));
            }
            node["codec_counts"] = std::move(codecs);
            return node;
        }

        Json::Value write_duplicates(const std::vector<DuplicateGroup>& groups) {
            Json::Value list(Json::arrayValue);
            for (const auto& group : groups) {
                Json::Value item(Json::objectValue);
                item["checksum"] = group.checksum;
                item["size"] = size_value(group.size);
                item["wasted_bytes"] = size_value(group.wasted_bytes);
                Json::Value paths(Json::arrayValue);
                for (const auto& path : group.paths) {
                    paths.append(text_value(path));
                }
                item["paths"] = std::move(paths);
                list.append(std::move(item));
            }
            return list;
        }

        // Reading side.

        std::string read_text(const Json::Value& value) {
            return restore_stray_bytes(value.asString());
        }

        std::optional<std::string> optional_string(const Json::Value& value) {
            if (value.isString()) {
                return read_text(value);
            }
            return std::nullopt;
        }

        std::optional<double> optional_double(const Json::Value& value) {
            if (value.isNumeric()) {
                return value.asDouble();
            }
            return std::nullopt;
        }

        std::optional<Resolution> parse_resolution(const Json::Value& value) {
            if (!value.isString()) {
                return std::nullopt;
            }
            const std::string text = value.asString();
            const auto separator = text.find('x');
            if (separator == std::string::npos) {
                return std::nullopt;
            }
            try {
                Resolution resolution {std::stoi(text.substr(0, separator)), std::stoi(text.substr(separator + 1))};
                if (resolution.width <= 0 || resolution.height <= 0) {
                    return std::nullopt;
                }
                return resolution;
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
        }

        VideoMetadata read_video_metadata(const Json::Value& value) {
            VideoMetadata video;
            video.duration = optional_double(value["duration"]);
            video.resolution = parse_resolution(value["resolution"]);
            video.fps = optional_double(value["fps"]);
            video.video_codec = optional_string(value["video_codec"]);
            video.audio_codec = optional_string(value["audio_codec"]);
            return video;
        }

        bool read_tree(const Json::Value& value, FileTreeDirectory& directory, std::string& error) {
            if (!value.isObject()) {
                error = "file_tree node is not an object";
                return false;
            }
            for (const auto& key : value.getMemberNames()) {
                const Json::Value& node = value[key];
                const std::string name = restore_stray_bytes(key);
                const std::string type = node["type"].asString();
                if (type == "directory") {
                    FileTreeDirectory child;
                    if (!read_tree(node["children"], child, error)) {
                        return false;
                    }
                    directory.children.push_back(FileTreeEntry {name, std::move(child)});
                } else if (type == "file") {
                    FileTreeLeaf leaf;
                    leaf.size = node["size"].asLargestUInt();
                    leaf.extension = read_text(node["extension"]);
                    leaf.is_video = node["is_video"].asBool();
                    if (node.isMember("video")) {
                        leaf.video = read_video_metadata(node["video"]);
                    }
                    directory.children.push_back(FileTreeEntry {name, std::move(leaf)});
                } else {
                    error = "unknown file_tree node type '" + type + "' for " + name;
                    return false;
                }
            }
            // Restored names may sort differently from their escaped keys.
            std::sort(directory.children.begin(), directory.children.end(),
                      [](const FileTreeEntry& lhs, const FileTreeEntry& rhs) { return lhs.name < rhs.name; });
            return true;
        }

        const std::vector<std::string>& age_bucket_order() {
            static const std::vector<std::string> kOrder = {
                "Last 24 hours", "Last 7 days", "Last 30 days", "Last year", "Older"};
            return kOrder;
        }
    }

    std::string report_to_json(const AggregateResult& result) {
        Json::Value root(Json::objectValue);
        root["generated_at"] = format_time(result.generated_at);

        Json::Value& general = root["general_stats"];
        general["total_files"] = size_value(result.general.total_files);
        general["total_size"] = size_value(result.general.total_size);
        general["average_size"] = double_value(result.general.average_size);
        general["oldest_file"] = text_value(result.general.oldest_file);
        general["newest_file"] = text_value(result.general.newest_file);
        general["total_directories"] = size_value(result.general.total_directories);

        Json::Value file_types(Json::arrayValue);
        for (const auto& stat : result.file_types) {
            Json::Value item(Json::objectValue);
            item["extension"] = text_value(stat.extension);
            item["count"] = size_value(stat.count);
            item["size"] = size_value(stat.total_size);
            item["percentage"] = double_value(stat.percentage);
            file_types.append(std::move(item));
        }
        root["file_types"] = std::move(file_types);

        Json::Value ages(Json::objectValue);
        for (const auto& bucket : result.age_distribution) {
            ages[bucket.label] = size_value(bucket.count);
        }
        root["age_distribution"] = std::move(ages);

        root["file_tree"] = write_tree(result.file_tree);

        if (result.video_stats) {
            root["video_stats"] = write_video_stats(*result.video_stats);
        }
        if (result.duplicates) {
            root["duplicates"] = write_duplicates(*result.duplicates);
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        builder["emitUTF8"] = true;
        return escape_surrogates(Json::writeString(builder, root)) + "\n";
    }

    std::optional<std::string> save_report(const AggregateResult& result, const std::filesystem::path& output) {
        std::ofstream file(output, std::ios::binary | std::ios::trunc);
        if (!file) {
            return "Unable to open " + output.string() + " for writing";
        }
        file << report_to_json(result);
        file.flush();
        if (!file) {
            return "Unable to write report to " + output.string();
        }
        return std::nullopt;
    }

    std::optional<AggregateResult> report_from_json(const std::string& json, std::string& error) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string parse_errors;
        if (!reader->parse(json.data(), json.data() + json.size(), &root, &parse_errors)) {
            error = "Invalid report JSON: " + parse_errors;
            return std::nullopt;
        }
        if (!root.isObject() || !root.isMember("general_stats")) {
            error = "Report is missing general_stats";
            return std::nullopt;
        }

        AggregateResult result;
        if (auto generated = parse_time(root["generated_at"].asString())) {
            result.generated_at = *generated;
        }

        const Json::Value& general = root["general_stats"];
        result.general.total_files = general["total_files"].asLargestUInt();
        result.general.total_size = general["total_size"].asLargestUInt();
        result.general.average_size = general["average_size"].asDouble();
        result.general.oldest_file = read_text(general["oldest_file"]);
        result.general.newest_file = read_text(general["newest_file"]);
        result.general.total_directories = general["total_directories"].asLargestUInt();

        for (const auto& item : root["file_types"]) {
            ExtensionStat stat;
            stat.extension = read_text(item["extension"]);
            stat.count = item["count"].asLargestUInt();
            stat.total_size = item["size"].asLargestUInt();
            stat.percentage = item["percentage"].asDouble();
            result.file_types.push_back(std::move(stat));
        }

        const Json::Value& ages = root["age_distribution"];
        for (const auto& label : age_bucket_order()) {
            if (ages.isMember(label)) {
                result.age_distribution.push_back(AgeBucket {label, ages[label].asLargestUInt()});
            }
        }

        if (!read_tree(root["file_tree"], result.file_tree, error)) {
            return std::nullopt;
        }

        if (root.isMember("video_stats")) {
            const Json::Value& video = root["video_stats"];
            VideoStats stats;
            stats.total_videos = video["total_videos"].asLargestUInt();
            stats.videos_with_metadata = video["videos_with_metadata"].asLargestUInt();
            stats.total_duration = video["total_duration"].asDouble();
            stats.average_duration = video["average_duration"].asDouble();
            for (const auto& item : video["resolution_counts"]) {
                stats.resolution_counts.push_back(ResolutionCount {item["resolution"].asString(), item["count"].asLargestUInt()});
            }
            for (const auto& item : video["codec_counts"]) {
                stats.codec_counts.push_back(CodecCount {optional_string(item["codec"]), item["count"].asLargestUInt()});
            }
            result.video_stats = std::move(stats);
        }

        if (root.isMember("duplicates")) {
            std::vector<DuplicateGroup> groups;
            for (const auto& item : root["duplicates"]) {
                DuplicateGroup group;
                group.checksum = item["checksum"].asString();
                group.size = item["size"].asLargestUInt();
                group.wasted_bytes = item["wasted_bytes"].asLargestUInt();
                for (const auto& path : item["paths"]) {
                    group.paths.push_back(read_text(path));
                }
                groups.push_back(std::move(group));
            }
            result.duplicates = std::move(groups);
        }

        return result;
    }

    std::optional<AggregateResult> load_report(const std::filesystem::path& input, std::string& error) {
        std::ifstream file(input, std::ios::binary);
        if (!file) {
            error = "Unable to open " + input.string();
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return report_from_json(contents.str(), error);
    }
}
