#include "mdpack/renderer.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "mdpack/logger.h"

namespace mdpack {

namespace {
constexpr std::string_view kFence = "```";

std::string read_file(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream in{path, std::ios::binary};
    if (!in.is_open()) {
        throw std::filesystem::filesystem_error("cannot open file",
            path, std::error_code{errno != 0 ? errno : EIO, std::generic_category()});
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw std::filesystem::filesystem_error("cannot read file", path, std::make_error_code(std::errc::io_error));
    }
    return content;
}
} // namespace

Renderer::Renderer(const Config::Options& options, std::ostream& out)
    : options_{options}, out_{out} {}

void Renderer::render(const std::vector<SelectedFile>& files) {
    render_header();
    for (const auto& file : files) {
        render_file(file);
    }
}

std::string Renderer::heading_for(const SelectedFile& file) const {
    if (options_.heading_style == Config::HeadingStyle::Relative) {
        return file.relative.generic_string();
    }
    return file.absolute.generic_string();
}

void Renderer::render_header() {
    if (options_.header_text.empty()) {
        return;
    }
    out_ << options_.header_text << "\n\n";
}

void Renderer::render_file(const SelectedFile& file) {
    const auto content = read_file(file.absolute);
    Logger::instance().trace("writing {} ({} bytes)", file.relative.generic_string(), content.size());

    out_ << "# " << heading_for(file) << '\n';
    out_ << kFence << '\n';
    out_ << content << '\n';
    out_ << kFence << '\n';
    out_ << '\n';
}

} // namespace mdpack
