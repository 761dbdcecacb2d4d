#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mdpack {

class ConfigError : public std::runtime_error {
public:
    enum class Kind {
        Unreadable,
        MissingBaseDir,
        RelativeBaseDirNotAllowed,
        BaseDirNotFound,
        NoIncludesSpecified,
        InvalidDirective
    };

    ConfigError(Kind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

class Config {
public:
    enum class Scheme {
        Structured,
        Glob
    };

    enum class HeadingStyle {
        Absolute,
        Relative
    };

    struct Options {
        std::string header_text;
        std::filesystem::path base_dir;
        std::vector<std::string> includes;

        // glob scheme
        std::vector<std::string> exclude_patterns;

        // structured scheme
        std::vector<std::string> exclude_folders;
        std::vector<std::string> exclude_extensions;
        std::vector<std::string> exclude_files;

        Scheme scheme = Scheme::Structured;
        HeadingStyle heading_style = HeadingStyle::Absolute;
    };

    Config() = default;
    explicit Config(Options options);

    static Config parse(std::string_view text);
    static Config load(const std::filesystem::path& path);

    void validate();

    void set_heading_style(HeadingStyle style) noexcept;

    const Options& options() const noexcept;

    static std::string normalize_extension(std::string_view value);

private:
    Options options_{};
};

std::string_view to_string(Config::Scheme scheme) noexcept;
std::string_view to_string(Config::HeadingStyle style) noexcept;

} // namespace mdpack
