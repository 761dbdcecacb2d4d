#include "mdpack/cli.h"

#include "mdpack/string_utils.h"
#include "mdpack/version.h"

namespace mdpack {

namespace {
constexpr std::string_view kDescription =
    "mdpack - bundle selected source files into a single Markdown document";
}

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "mdpack")} {
    app_->set_version_flag("--version", std::string{Version::String()});
    app_->footer(R"(The input file holds optional header text, a line containing only ---,
then one key=value directive per line: basedir, include, exclude,
excludefolder, excludeextension, excludefile, heading, scheme.

Exit status:
 0  if OK (also when no file matched),
 1  if the configuration, the traversal or the output failed.)");

    app_->add_option("-i,--input", input_, "Configuration file to read")
        ->type_name("PATH")
        ->default_str("input.txt");
    app_->add_option("-o,--output", output_, "Markdown document to write (overwritten)")
        ->type_name("PATH")
        ->default_str("output.txt");
    app_->add_option("--heading", heading_, "Heading path style (absolute, relative)")
        ->type_name("STYLE")
        ->check(CLI::IsMember({"absolute", "relative"}, CLI::ignore_case));
    app_->add_option("-v,--log-level", log_level_, "Set log verbosity (error, warn, info, debug, trace)")
        ->type_name("LEVEL")
        ->default_str("warn")
        ->check(CLI::IsMember({"error", "warn", "warning", "info", "debug", "trace"}, CLI::ignore_case));
}

Cli::~Cli() = default;

std::optional<int> Cli::parse(int argc, char** argv, RunOptions& options) {
    input_.clear();
    output_.clear();
    heading_.clear();
    log_level_.clear();
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        return app_->exit(ex);
    }

    options = RunOptions{};
    if (!input_.empty()) {
        options.input = input_;
    }
    if (!output_.empty()) {
        options.output = output_;
    }
    if (!heading_.empty()) {
        options.heading = string_utils::to_lower(heading_) == "relative" ? Config::HeadingStyle::Relative
                                                                         : Config::HeadingStyle::Absolute;
    }
    if (!log_level_.empty()) {
        if (auto level = Logger::parse_level(log_level_)) {
            options.log_level = *level;
        }
    }
    return std::nullopt;
}

} // namespace mdpack
