#pragma once

#include <memory>

#include "mdpack/cli.h"

namespace mdpack {

class App {
public:
    App();
    ~App();

    int run(int argc, char** argv);
    int run(const RunOptions& options);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mdpack
