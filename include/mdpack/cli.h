#pragma once

#include <CLI/CLI.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "mdpack/config.h"
#include "mdpack/logger.h"

namespace mdpack {

struct RunOptions {
    std::filesystem::path input{"input.txt"};
    std::filesystem::path output{"output.txt"};
    std::optional<Config::HeadingStyle> heading;
    Logger::Level log_level = Logger::Level::Warning;
};

class Cli {
public:
    Cli();
    ~Cli();

    // Returns an exit code when the process should stop here (help,
    // version, invalid flags); otherwise fills `options`.
    std::optional<int> parse(int argc, char** argv, RunOptions& options);

private:
    std::unique_ptr<CLI::App> app_;
    std::string input_;
    std::string output_;
    std::string heading_;
    std::string log_level_;
};

} // namespace mdpack
