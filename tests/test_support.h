#pragma once

#undef NDEBUG
#include <cassert>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace mdpack::test {

// Fresh scratch directory per test binary, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : path_{fs::temp_directory_path() / ("mdpack_" + name + "_" + std::to_string(::getpid()))} {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const noexcept { return path_; }

    fs::path operator/(const fs::path& relative) const { return path_ / relative; }

    void reset() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    assert(out.is_open());
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in{path, std::ios::binary};
    assert(in.is_open());
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

inline std::string capture_stdout(const std::function<void()>& func) {
    std::stringstream buffer;
    std::streambuf* old = std::cout.rdbuf(buffer.rdbuf());
    func();
    std::cout.rdbuf(old);
    return buffer.str();
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Restores the working directory when leaving scope.
class CurrentPathGuard {
public:
    explicit CurrentPathGuard(const fs::path& path)
        : previous_{fs::current_path()} {
        fs::current_path(path);
    }

    CurrentPathGuard(const CurrentPathGuard&) = delete;
    CurrentPathGuard& operator=(const CurrentPathGuard&) = delete;

    ~CurrentPathGuard() {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

private:
    fs::path previous_;
};

} // namespace mdpack::test
