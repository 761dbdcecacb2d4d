#include "mdpack/config.h"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "mdpack/logger.h"
#include "mdpack/string_utils.h"

namespace mdpack {

namespace {
constexpr std::string_view kSeparator = "---";

std::string_view strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

Config::HeadingStyle default_heading(Config::Scheme scheme) {
    return scheme == Config::Scheme::Glob ? Config::HeadingStyle::Relative : Config::HeadingStyle::Absolute;
}
} // namespace

Config::Config(Options options)
    : options_{std::move(options)} {}

Config Config::parse(std::string_view text) {
    Options options;
    std::vector<std::string> header_lines;
    bool in_header = true;
    bool saw_separator = false;
    bool scheme_explicit = false;
    bool heading_explicit = false;

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const auto line = strip_cr(text.substr(pos, end - pos));
        pos = end + 1;

        if (line == kSeparator) {
            in_header = false;
            saw_separator = true;
            continue;
        }

        if (in_header) {
            header_lines.emplace_back(line);
            continue;
        }

        if (line.empty()) {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }

        const auto key = string_utils::to_lower(string_utils::trim(line.substr(0, eq)));
        auto value = string_utils::trim(line.substr(eq + 1));

        if (key == "basedir") {
            options.base_dir = value;
        } else if (key == "include") {
            options.includes.push_back(std::move(value));
        } else if (key == "exclude") {
            options.exclude_patterns.push_back(std::move(value));
        } else if (key == "excludefolder") {
            options.exclude_folders.push_back(std::move(value));
        } else if (key == "excludeextension") {
            options.exclude_extensions.push_back(normalize_extension(value));
        } else if (key == "excludefile") {
            options.exclude_files.push_back(std::move(value));
        } else if (key == "heading") {
            const auto word = string_utils::to_lower(value);
            if (word == "absolute") {
                options.heading_style = HeadingStyle::Absolute;
            } else if (word == "relative") {
                options.heading_style = HeadingStyle::Relative;
            } else {
                throw ConfigError{ConfigError::Kind::InvalidDirective,
                                  "heading must be 'absolute' or 'relative', got '" + value + "'"};
            }
            heading_explicit = true;
        } else if (key == "scheme") {
            const auto word = string_utils::to_lower(value);
            if (word == "structured") {
                options.scheme = Scheme::Structured;
            } else if (word == "glob") {
                options.scheme = Scheme::Glob;
            } else {
                throw ConfigError{ConfigError::Kind::InvalidDirective,
                                  "scheme must be 'structured' or 'glob', got '" + value + "'"};
            }
            scheme_explicit = true;
        } else {
            Logger::instance().debug("ignoring unknown directive '{}'", key);
        }
    }

    if (saw_separator) {
        for (std::size_t i = 0; i < header_lines.size(); ++i) {
            if (i > 0) {
                options.header_text += '\n';
            }
            options.header_text += header_lines[i];
        }
    }

    if (!scheme_explicit) {
        bool glob = !options.exclude_patterns.empty();
        for (const auto& include : options.includes) {
            glob = glob || string_utils::has_glob_meta(include);
        }
        options.scheme = glob ? Scheme::Glob : Scheme::Structured;
    }
    if (!heading_explicit) {
        options.heading_style = default_heading(options.scheme);
    }

    return Config{std::move(options)};
}

Config Config::load(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream in{path, std::ios::binary};
    if (!in.is_open()) {
        const std::error_code ec{errno != 0 ? errno : EIO, std::generic_category()};
        throw ConfigError{ConfigError::Kind::Unreadable,
                          "cannot open " + path.string() + ": " + ec.message()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw ConfigError{ConfigError::Kind::Unreadable, "error reading " + path.string()};
    }
    return parse(buffer.str());
}

void Config::validate() {
    if (options_.base_dir.empty()) {
        throw ConfigError{ConfigError::Kind::MissingBaseDir, "basedir is required"};
    }

    if (options_.base_dir.is_relative()) {
        if (options_.scheme == Scheme::Glob) {
            throw ConfigError{ConfigError::Kind::RelativeBaseDirNotAllowed,
                              "basedir must be an absolute path: " + options_.base_dir.string()};
        }
        std::error_code ec;
        auto absolute = std::filesystem::absolute(options_.base_dir, ec);
        if (ec) {
            throw ConfigError{ConfigError::Kind::BaseDirNotFound,
                              "cannot resolve basedir " + options_.base_dir.string() + ": " + ec.message()};
        }
        Logger::instance().debug("resolved basedir {} to {}", options_.base_dir.string(), absolute.string());
        options_.base_dir = std::move(absolute);
    }
    options_.base_dir = options_.base_dir.lexically_normal();
    if (options_.base_dir.filename().empty() && options_.base_dir != options_.base_dir.root_path()) {
        options_.base_dir = options_.base_dir.parent_path();
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(options_.base_dir, ec)) {
        throw ConfigError{ConfigError::Kind::BaseDirNotFound,
                          "basedir does not exist: " + options_.base_dir.string()};
    }

    if (options_.includes.empty()) {
        throw ConfigError{ConfigError::Kind::NoIncludesSpecified, "at least one include is required"};
    }
}

void Config::set_heading_style(HeadingStyle style) noexcept {
    options_.heading_style = style;
}

const Config::Options& Config::options() const noexcept {
    return options_;
}

std::string Config::normalize_extension(std::string_view value) {
    if (value.empty() || value.front() == '*') {
        return std::string{value};
    }
    if (value.front() == '.') {
        value.remove_prefix(1);
    }
    return "*." + std::string{value};
}

std::string_view to_string(Config::Scheme scheme) noexcept {
    switch (scheme) {
        case Config::Scheme::Structured:
            return "structured";
        case Config::Scheme::Glob:
            return "glob";
    }
    return "unknown";
}

std::string_view to_string(Config::HeadingStyle style) noexcept {
    switch (style) {
        case Config::HeadingStyle::Absolute:
            return "absolute";
        case Config::HeadingStyle::Relative:
            return "relative";
    }
    return "unknown";
}

} // namespace mdpack
