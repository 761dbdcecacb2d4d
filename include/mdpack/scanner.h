#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <set>
#include <vector>

#include "mdpack/config.h"
#include "mdpack/path_filter.h"

namespace mdpack {

struct SelectedFile {
    std::filesystem::path relative;
    std::filesystem::path absolute;
};

class FileSystemScanner {
public:
    struct Stats {
        std::size_t selected = 0;
        std::size_t excluded = 0;
        std::size_t pruned_directories = 0;
        std::size_t binary_skipped = 0;
        std::size_t unreadable_skipped = 0;
        std::size_t missing_includes = 0;
    };

    // `options` must come from a validated Config.
    explicit FileSystemScanner(const Config::Options& options);

    // Throws std::filesystem::filesystem_error when a directory below a
    // walked root cannot be read.
    std::vector<SelectedFile> collect();

    const Stats& stats() const noexcept;

private:
    using NameMatcher = std::function<bool(const std::filesystem::path&)>;

    void collect_structured(std::vector<SelectedFile>& out);
    void collect_glob(std::vector<SelectedFile>& out);
    std::filesystem::path relative_root(const std::filesystem::path& target,
                                        const std::filesystem::path& entry) const;

    void walk_directory(const std::filesystem::path& dir, const std::filesystem::path& relative, bool is_root,
                        const NameMatcher& matches, std::vector<SelectedFile>& out);
    void consider_file(const std::filesystem::path& path, const std::filesystem::path& relative,
                       std::vector<SelectedFile>& out);

    const Config::Options& options_;
    PathFilter filter_;
    Stats stats_{};
    std::set<std::filesystem::path> seen_;
};

} // namespace mdpack
