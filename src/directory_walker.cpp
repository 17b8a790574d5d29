#include <system_error>
#include "file_insights/errors.hpp"
#include "file_insights/logging.hpp"
#include "file_insights/path_filter.hpp"
#include "file_insights/directory_walker.hpp"

namespace file_insights {

    namespace {
        using Path = std::filesystem::path;
        namespace fs = std::filesystem;

        enum class EntryKind {
            File,
            Directory,
            Ignored
        };

        // Symlinked directories are never followed; a symlink to a regular file counts as that file.
        EntryKind classify_entry(const fs::directory_entry& entry) {
            std::error_code status_error;
            const auto link_status = entry.symlink_status(status_error);
            if (status_error) {
                return EntryKind::Ignored;
            }

            if (fs::is_symlink(link_status)) {
                const auto target_status = entry.status(status_error);
                if (!status_error && fs::is_regular_file(target_status)) {
                    return EntryKind::File;
                }
                return EntryKind::Ignored;
            }
            if (fs::is_directory(link_status)) {
                return EntryKind::Directory;
            }
            if (fs::is_regular_file(link_status)) {
                return EntryKind::File;
            }
            return EntryKind::Ignored;
        }

        bool cancelled(const std::atomic<bool>* cancel) {
            return cancel && cancel->load(std::memory_order_relaxed);
        }

        // Lists one directory: admitted files go to the result, subdirectories that
        // survive the filter go to subdirs in enumeration order.
        bool list_directory(const Path& directory,
                            const std::vector<std::string>& patterns,
                            WalkResult& result,
                            std::vector<Path>* subdirs) {
            std::error_code iterator_error;
            fs::directory_iterator it(directory, iterator_error);
            fs::directory_iterator end;
            if (iterator_error) {
                result.warnings.push_back("Unable to read directory " + directory.string() + ": " + iterator_error.message());
                return false;
            }

            while (it != end) {
                const auto& entry = *it;
                switch (classify_entry(entry)) {
                    case EntryKind::File:
                        if (!should_exclude(entry.path(), patterns)) {
                            result.files.push_back(entry.path());
                        }
                        break;
                    case EntryKind::Directory:
                        if (subdirs) {
                            if (should_exclude(entry.path(), patterns)) {
                                logger()->debug("Pruning excluded directory {}", entry.path().string());
                            } else {
                                subdirs->push_back(entry.path());
                            }
                        }
                        break;
                    case EntryKind::Ignored:
                        break;
                }

                it.increment(iterator_error);
                if (iterator_error) {
                    result.warnings.push_back("Directory traversal warning in " + directory.string() + ": " + iterator_error.message());
                    break;
                }
            }
            return true;
        }
    }

    WalkResult walk_directory(const Path& root,
                              bool recursive,
                              const std::vector<std::string>& patterns,
                              const std::atomic<bool>* cancel) {
        WalkResult result;

        std::error_code root_error;
        if (!fs::is_directory(root, root_error)) {
            throw ScanError(root.string() + " is not a readable directory" +
                            (root_error ? ": " + root_error.message() : std::string()));
        }

        if (!recursive) {
            if (!list_directory(root, patterns, result, nullptr)) {
                throw ScanError(result.warnings.back());
            }
            return result;
        }

        std::vector<Path> pending {root};
        bool is_root = true;
        while (!pending.empty() && !cancelled(cancel)) {
            const Path directory = std::move(pending.back());
            pending.pop_back();

            std::vector<Path> subdirs;
            if (!list_directory(directory, patterns, result, &subdirs)) {
                if (is_root) {
                    throw ScanError(result.warnings.back());
                }
                logger()->debug("{}", result.warnings.back());
            }
            is_root = false;

            // Reverse so the first enumerated subdirectory is visited next.
            pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
        }

        return result;
    }
}
