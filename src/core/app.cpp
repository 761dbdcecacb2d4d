#include "mdpack/app.h"

#include <cerrno>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "mdpack/config.h"
#include "mdpack/logger.h"
#include "mdpack/perf.h"
#include "mdpack/renderer.h"
#include "mdpack/scanner.h"

namespace mdpack {

class App::Impl {
public:
    int run(const RunOptions& run_options) {
        auto& logger = Logger::instance();
        logger.set_level(run_options.log_level);

        Config config = Config::load(run_options.input);
        if (run_options.heading) {
            config.set_heading_style(*run_options.heading);
        }
        config.validate();

        const auto& options = config.options();
        logger.info("scanning {} ({} scheme, {} headings, {} includes)", options.base_dir.string(),
                    to_string(options.scheme), to_string(options.heading_style), options.includes.size());

        FileSystemScanner scanner{options};
        std::vector<SelectedFile> files;
        {
            perf::ScopedTimer timer{"scan"};
            files = scanner.collect();
        }

        const auto& stats = scanner.stats();
        logger.info("selected {} files ({} excluded, {} binary, {} unreadable, {} folders pruned)", stats.selected,
                    stats.excluded, stats.binary_skipped, stats.unreadable_skipped, stats.pruned_directories);
        if (files.empty()) {
            logger.warn("no files found matching the include/exclude rules");
        }

        write_output(options, files, run_options.output);

        std::cout << "Successfully processed " << files.size() << " files\n";
        std::cout << "Output written to: " << run_options.output.string() << '\n';
        return 0;
    }

private:
    static void write_output(const Config::Options& options, const std::vector<SelectedFile>& files,
                             const std::filesystem::path& output) {
        perf::ScopedTimer timer{"render"};
        errno = 0;
        std::ofstream stream{output, std::ios::binary | std::ios::out | std::ios::trunc};
        if (!stream.is_open()) {
            throw std::filesystem::filesystem_error("cannot create output file", output,
                std::error_code{errno != 0 ? errno : EIO, std::generic_category()});
        }

        Renderer renderer{options, stream};
        renderer.render(files);

        stream.flush();
        if (!stream) {
            throw std::filesystem::filesystem_error("cannot write output file", output,
                                                    std::make_error_code(std::errc::io_error));
        }
    }
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    Cli cli;
    RunOptions options;
    if (auto exit_code = cli.parse(argc, argv, options)) {
        return *exit_code;
    }
    return run(options);
}

int App::run(const RunOptions& options) {
    try {
        return impl_->run(options);
    } catch (const ConfigError& ex) {
        const std::string_view context = ex.kind() == ConfigError::Kind::Unreadable ? "cannot read configuration"
                                                                                    : "invalid configuration";
        std::cerr << "mdpack: error: " << context << ": " << ex.what() << '\n';
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "mdpack: error: " << ex.what() << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "mdpack: error: " << ex.what() << '\n';
    }
    return 1;
}

} // namespace mdpack
