#include <fnmatch.h>
#include <algorithm>
#include "file_insights/path_filter.hpp"

namespace file_insights {

    // Shell-style matching: '*' also crosses separators, so "**" behaves as '*',
    // and a backslash is an ordinary character.
    bool matches_pattern(const std::string& text, const std::string& pattern) {
        return fnmatch(pattern.c_str(), text.c_str(), FNM_NOESCAPE) == 0;
    }

    bool should_exclude(const std::filesystem::path& path, const std::vector<std::string>& patterns) {
        const std::string native = path.string();
        return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pattern) {
            return matches_pattern(native, pattern);
        });
    }
}
