#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "mdpack/config.h"

namespace mdpack {

class ExclusionRule {
public:
    enum class Kind {
        FolderName,
        Extension,
        ExactPath,
        Glob
    };

    virtual ~ExclusionRule() = default;

    [[nodiscard]] virtual Kind kind() const noexcept = 0;

    // Directory-scoped rules return true to prune the whole subtree.
    [[nodiscard]] virtual bool excludes_directory(const std::filesystem::path& /*dir*/) const { return false; }

    // `relative` is relative to the base directory and slash-normalized.
    [[nodiscard]] virtual bool excludes_file(const std::filesystem::path& /*path*/,
                                             std::string_view /*relative*/) const {
        return false;
    }
};

class FolderNameRule final : public ExclusionRule {
public:
    explicit FolderNameRule(std::string name);

    Kind kind() const noexcept override { return Kind::FolderName; }
    bool excludes_directory(const std::filesystem::path& dir) const override;

private:
    std::string name_;
};

class ExtensionRule final : public ExclusionRule {
public:
    // `pattern` is in normalized "*.ext" form.
    explicit ExtensionRule(std::string pattern);

    Kind kind() const noexcept override { return Kind::Extension; }
    bool excludes_file(const std::filesystem::path& path, std::string_view relative) const override;

private:
    std::string pattern_;
};

class ExactPathRule final : public ExclusionRule {
public:
    explicit ExactPathRule(std::string entry);

    Kind kind() const noexcept override { return Kind::ExactPath; }
    bool excludes_file(const std::filesystem::path& path, std::string_view relative) const override;

private:
    std::string entry_;
};

class GlobRule final : public ExclusionRule {
public:
    explicit GlobRule(std::string pattern);

    Kind kind() const noexcept override { return Kind::Glob; }
    bool excludes_file(const std::filesystem::path& path, std::string_view relative) const override;

private:
    std::string pattern_;
};

class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const Config::Options& options);

    void add_rule(std::unique_ptr<ExclusionRule> rule);

    [[nodiscard]] bool is_excluded_folder(const std::filesystem::path& dir) const;
    [[nodiscard]] bool is_excluded_file(const std::filesystem::path& path, const std::filesystem::path& relative) const;

    [[nodiscard]] bool has_folder_rules() const noexcept { return folder_rules_ > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

    // Single-level glob against a base name: '*', '?', bracket classes.
    [[nodiscard]] static bool matches_glob(std::string_view pattern, std::string_view name);
    [[nodiscard]] static bool matches_any_pattern(std::string_view name, const std::vector<std::string>& patterns);

private:
    std::vector<std::unique_ptr<ExclusionRule>> rules_;
    std::size_t folder_rules_ = 0;
};

} // namespace mdpack
