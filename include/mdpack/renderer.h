#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "mdpack/config.h"
#include "mdpack/scanner.h"

namespace mdpack {

class Renderer {
public:
    Renderer(const Config::Options& options, std::ostream& out);

    // Throws std::filesystem::filesystem_error if a selected file can no
    // longer be read.
    void render(const std::vector<SelectedFile>& files);

    [[nodiscard]] std::string heading_for(const SelectedFile& file) const;

private:
    void render_header();
    void render_file(const SelectedFile& file);

    const Config::Options& options_;
    std::ostream& out_;
};

} // namespace mdpack
