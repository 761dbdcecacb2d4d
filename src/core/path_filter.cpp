#include "mdpack/path_filter.h"

#include <fnmatch.h>

#include <utility>

#include "mdpack/logger.h"
#include "mdpack/string_utils.h"

namespace mdpack {

FolderNameRule::FolderNameRule(std::string name)
    : name_{std::move(name)} {}

bool FolderNameRule::excludes_directory(const std::filesystem::path& dir) const {
    auto name = dir.filename();
    if (name.empty()) {
        name = dir.parent_path().filename();
    }
    return name.string() == name_;
}

ExtensionRule::ExtensionRule(std::string pattern)
    : pattern_{std::move(pattern)} {}

bool ExtensionRule::excludes_file(const std::filesystem::path& path, std::string_view) const {
    const auto extension = path.extension().string();
    if (extension.empty()) {
        return false;
    }
    return PathFilter::matches_glob(pattern_, extension);
}

ExactPathRule::ExactPathRule(std::string entry)
    : entry_{string_utils::normalize_path(entry)} {}

bool ExactPathRule::excludes_file(const std::filesystem::path& path, std::string_view relative) const {
    return relative == entry_ || path.filename().string() == entry_;
}

GlobRule::GlobRule(std::string pattern)
    : pattern_{std::move(pattern)} {}

bool GlobRule::excludes_file(const std::filesystem::path& path, std::string_view) const {
    return PathFilter::matches_glob(pattern_, path.filename().string());
}

PathFilter::PathFilter(const Config::Options& options) {
    for (const auto& name : options.exclude_folders) {
        add_rule(std::make_unique<FolderNameRule>(name));
    }
    for (const auto& pattern : options.exclude_extensions) {
        add_rule(std::make_unique<ExtensionRule>(pattern));
    }
    for (const auto& entry : options.exclude_files) {
        add_rule(std::make_unique<ExactPathRule>(entry));
    }
    for (const auto& pattern : options.exclude_patterns) {
        add_rule(std::make_unique<GlobRule>(pattern));
    }
    Logger::instance().debug("path filter built with {} rules ({} folder-scoped)", rules_.size(), folder_rules_);
}

void PathFilter::add_rule(std::unique_ptr<ExclusionRule> rule) {
    if (!rule) {
        return;
    }
    if (rule->kind() == ExclusionRule::Kind::FolderName) {
        ++folder_rules_;
    }
    rules_.push_back(std::move(rule));
}

bool PathFilter::is_excluded_folder(const std::filesystem::path& dir) const {
    if (folder_rules_ == 0) {
        return false;
    }
    for (const auto& rule : rules_) {
        if (rule->excludes_directory(dir)) {
            return true;
        }
    }
    return false;
}

bool PathFilter::is_excluded_file(const std::filesystem::path& path, const std::filesystem::path& relative) const {
    const auto normalized = string_utils::normalize_path(relative);
    for (const auto& rule : rules_) {
        if (rule->excludes_file(path, normalized)) {
            return true;
        }
    }
    return false;
}

bool PathFilter::matches_glob(std::string_view pattern, std::string_view name) {
    const std::string pattern_str{pattern};
    const std::string name_str{name};
    return ::fnmatch(pattern_str.c_str(), name_str.c_str(), FNM_PATHNAME) == 0;
}

bool PathFilter::matches_any_pattern(std::string_view name, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (matches_glob(pattern, name)) {
            return true;
        }
    }
    return false;
}

} // namespace mdpack
