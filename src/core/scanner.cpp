#include "mdpack/scanner.h"

#include <algorithm>
#include <string>
#include <system_error>

#include "mdpack/classifier.h"
#include "mdpack/logger.h"
#include "mdpack/string_utils.h"

namespace mdpack {

FileSystemScanner::FileSystemScanner(const Config::Options& options)
    : options_{options}, filter_{options} {}

std::vector<SelectedFile> FileSystemScanner::collect() {
    stats_ = Stats{};
    seen_.clear();

    std::vector<SelectedFile> files;
    if (options_.scheme == Config::Scheme::Glob) {
        collect_glob(files);
    } else {
        collect_structured(files);
    }
    stats_.selected = files.size();
    return files;
}

const FileSystemScanner::Stats& FileSystemScanner::stats() const noexcept {
    return stats_;
}

void FileSystemScanner::collect_structured(std::vector<SelectedFile>& out) {
    const NameMatcher any = [](const std::filesystem::path&) { return true; };

    for (const auto& include : options_.includes) {
        const std::filesystem::path entry{include};
        const auto target = (options_.base_dir / entry).lexically_normal();

        std::error_code ec;
        const auto status = std::filesystem::status(target, ec);
        if (ec || !std::filesystem::exists(status)) {
            Logger::instance().warn("cannot access include {}: {}", include,
                                    ec ? ec.message() : std::string{"no such file or directory"});
            ++stats_.missing_includes;
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            if (filter_.is_excluded_folder(target)) {
                Logger::instance().debug("include {} is an excluded folder", include);
                ++stats_.pruned_directories;
                continue;
            }
            walk_directory(target, relative_root(target, entry), true, any, out);
        } else if (std::filesystem::is_regular_file(status)) {
            consider_file(target, relative_root(target, entry), out);
        } else {
            Logger::instance().warn("skipping include {}: not a regular file or directory", include);
            ++stats_.missing_includes;
        }
    }
}

// Targets inside base_dir are named relative to it, whatever form the include
// took. Anything outside keeps the include entry as written.
std::filesystem::path FileSystemScanner::relative_root(const std::filesystem::path& target,
                                                       const std::filesystem::path& entry) const {
    const auto relative = target.lexically_relative(options_.base_dir);
    if (relative.empty() || *relative.begin() == "..") {
        return entry.lexically_normal();
    }
    return relative;
}

void FileSystemScanner::collect_glob(std::vector<SelectedFile>& out) {
    const NameMatcher included = [this](const std::filesystem::path& path) {
        return PathFilter::matches_any_pattern(path.filename().string(), options_.includes);
    };
    walk_directory(options_.base_dir, {}, false, included, out);
}

void FileSystemScanner::walk_directory(const std::filesystem::path& dir, const std::filesystem::path& relative,
                                       bool is_root, const NameMatcher& matches, std::vector<SelectedFile>& out) {
    std::error_code ec;
    std::vector<std::filesystem::directory_entry> entries;
    for (std::filesystem::directory_iterator it{dir, ec}; !ec && it != std::filesystem::directory_iterator{};
         it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        if (is_root) {
            Logger::instance().warn("cannot read include {}: {}", relative.generic_string(), ec.message());
            ++stats_.missing_includes;
            return;
        }
        throw std::filesystem::filesystem_error("cannot read directory", dir, ec);
    }

    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.path().filename().string() < rhs.path().filename().string();
    });

    for (const auto& entry : entries) {
        const auto name = entry.path().filename();
        const auto child_relative = relative.empty() ? name : relative / name;

        std::error_code type_ec;
        const bool is_symlink = entry.is_symlink(type_ec);
        const bool is_directory = !is_symlink && entry.is_directory(type_ec);

        if (is_directory) {
            if (filter_.is_excluded_folder(entry.path())) {
                Logger::instance().debug("pruning excluded folder {}", child_relative.generic_string());
                ++stats_.pruned_directories;
                continue;
            }
            walk_directory(entry.path(), child_relative, false, matches, out);
            continue;
        }

        if (is_symlink && entry.is_directory(type_ec)) {
            Logger::instance().debug("not following directory symlink {}", child_relative.generic_string());
            continue;
        }

        if (!entry.is_regular_file(type_ec)) {
            continue;
        }

        if (!matches(entry.path())) {
            continue;
        }
        consider_file(entry.path(), child_relative, out);
    }
}

void FileSystemScanner::consider_file(const std::filesystem::path& path, const std::filesystem::path& relative,
                                      std::vector<SelectedFile>& out) {
    const auto display = string_utils::normalize_path(relative);

    if (filter_.is_excluded_file(path, relative)) {
        Logger::instance().debug("excluded {}", display);
        ++stats_.excluded;
        return;
    }

    const auto absolute = path.lexically_normal();
    if (!seen_.insert(absolute).second) {
        Logger::instance().debug("{} already selected by an earlier include", display);
        return;
    }

    std::error_code ec;
    const bool binary = ContentClassifier::is_binary(absolute, ec);
    if (ec) {
        Logger::instance().warn("cannot read {}: {}", display, ec.message());
        ++stats_.unreadable_skipped;
        return;
    }
    if (binary) {
        Logger::instance().warn("skipping binary file: {}", display);
        ++stats_.binary_skipped;
        return;
    }

    Logger::instance().trace("selected {}", display);
    out.push_back(SelectedFile{relative.lexically_normal(), absolute});
}

} // namespace mdpack
