#include "test_support.h"

#include "mdpack/config.h"
#include "mdpack/logger.h"

using mdpack::Config;
using mdpack::ConfigError;
using namespace mdpack::test;

namespace {

ConfigError::Kind validation_error(Config config) {
    try {
        config.validate();
    } catch (const ConfigError& ex) {
        return ex.kind();
    }
    assert(false && "validate() should have thrown");
    return ConfigError::Kind::Unreadable;
}

void test_header_and_directives() {
    std::cout << "Test: Header and directives..." << std::flush;
    const auto config = Config::parse("Project context\n\nRead carefully.\n---\nbasedir=/srv/app\ninclude=src\n");
    const auto& options = config.options();
    assert(options.header_text == "Project context\n\nRead carefully.");
    assert(options.base_dir == "/srv/app");
    assert(options.includes.size() == 1);
    assert(options.includes[0] == "src");
    std::cout << " Passed\n";
}

void test_keys_and_values_are_normalized() {
    std::cout << "Test: Keys lower-cased, values trimmed..." << std::flush;
    const auto config = Config::parse("---\n  BaseDir  =  /srv/app  \nINCLUDE= docs \nInclude=a=b\n");
    const auto& options = config.options();
    assert(options.base_dir == "/srv/app");
    assert(options.includes.size() == 2);
    assert(options.includes[0] == "docs");
    assert(options.includes[1] == "a=b");
    std::cout << " Passed\n";
}

void test_ignored_lines() {
    std::cout << "Test: Blank, bare and unknown directive lines..." << std::flush;
    const auto config = Config::parse("---\n\nnot a directive\ncolour=blue\ninclude=src\n\n");
    const auto& options = config.options();
    assert(options.includes.size() == 1);
    assert(options.exclude_folders.empty());
    assert(options.exclude_patterns.empty());
    std::cout << " Passed\n";
}

void test_include_order_preserved() {
    std::cout << "Test: Include order preserved..." << std::flush;
    const auto config = Config::parse("---\ninclude=zeta\ninclude=alpha\ninclude=mid/file.txt\n");
    const auto& includes = config.options().includes;
    assert(includes.size() == 3);
    assert(includes[0] == "zeta");
    assert(includes[1] == "alpha");
    assert(includes[2] == "mid/file.txt");
    std::cout << " Passed\n";
}

void test_crlf_input() {
    std::cout << "Test: CRLF line endings..." << std::flush;
    const auto config = Config::parse("Header\r\n---\r\nbasedir=/srv/app\r\ninclude=src\r\n");
    assert(config.options().header_text == "Header");
    assert(config.options().base_dir == "/srv/app");
    assert(config.options().includes[0] == "src");
    std::cout << " Passed\n";
}

void test_missing_separator() {
    std::cout << "Test: Input without separator..." << std::flush;
    const auto config = Config::parse("basedir=/srv/app\ninclude=src\n");
    assert(config.options().header_text.empty());
    assert(config.options().base_dir.empty());
    assert(config.options().includes.empty());
    std::cout << " Passed\n";
}

void test_structured_exclusions() {
    std::cout << "Test: Structured exclusion directives..." << std::flush;
    const auto config = Config::parse(
        "---\ninclude=src\nexcludefolder=node_modules\nexcludeextension=json\n"
        "excludeextension=.lock\nexcludeextension=*.min.js\nexcludefile=src/config/dev.js\n");
    const auto& options = config.options();
    assert(options.scheme == Config::Scheme::Structured);
    assert(options.heading_style == Config::HeadingStyle::Absolute);
    assert(options.exclude_folders.size() == 1 && options.exclude_folders[0] == "node_modules");
    assert(options.exclude_extensions.size() == 3);
    assert(options.exclude_extensions[0] == "*.json");
    assert(options.exclude_extensions[1] == "*.lock");
    assert(options.exclude_extensions[2] == "*.min.js");
    assert(options.exclude_files.size() == 1 && options.exclude_files[0] == "src/config/dev.js");
    std::cout << " Passed\n";
}

void test_scheme_detection() {
    std::cout << "Test: Scheme detection..." << std::flush;
    assert(Config::parse("---\ninclude=*.go\n").options().scheme == Config::Scheme::Glob);
    assert(Config::parse("---\ninclude=main.go\nexclude=*_test.go\n").options().scheme == Config::Scheme::Glob);
    assert(Config::parse("---\ninclude=src\n").options().scheme == Config::Scheme::Structured);
    assert(Config::parse("---\ninclude=*.go\nscheme=structured\n").options().scheme == Config::Scheme::Structured);
    assert(Config::parse("---\ninclude=main.go\nscheme=GLOB\n").options().scheme == Config::Scheme::Glob);
    assert(Config::parse("---\ninclude=*.go\n").options().heading_style == Config::HeadingStyle::Relative);
    std::cout << " Passed\n";
}

void test_heading_directive() {
    std::cout << "Test: Heading directive..." << std::flush;
    assert(Config::parse("---\ninclude=src\nheading=relative\n").options().heading_style ==
           Config::HeadingStyle::Relative);
    assert(Config::parse("---\ninclude=*.go\nheading=Absolute\n").options().heading_style ==
           Config::HeadingStyle::Absolute);

    bool threw = false;
    try {
        (void)Config::parse("---\nheading=sideways\n");
    } catch (const ConfigError& ex) {
        threw = ex.kind() == ConfigError::Kind::InvalidDirective;
    }
    assert(threw);
    std::cout << " Passed\n";
}

void test_validate_errors() {
    std::cout << "Test: Validation error kinds..." << std::flush;
    ScratchDir scratch{"config"};

    assert(validation_error(Config::parse("---\ninclude=src\n")) == ConfigError::Kind::MissingBaseDir);

    const auto missing = (scratch / "does-not-exist").string();
    assert(validation_error(Config::parse("---\nbasedir=" + missing + "\ninclude=src\n")) ==
           ConfigError::Kind::BaseDirNotFound);

    write_file(scratch / "plain.txt", "not a directory");
    assert(validation_error(Config::parse("---\nbasedir=" + (scratch / "plain.txt").string() + "\ninclude=src\n")) ==
           ConfigError::Kind::BaseDirNotFound);

    assert(validation_error(Config::parse("---\nbasedir=" + scratch.path().string() + "\n")) ==
           ConfigError::Kind::NoIncludesSpecified);

    assert(validation_error(Config::parse("---\nbasedir=relative/dir\ninclude=*.go\n")) ==
           ConfigError::Kind::RelativeBaseDirNotAllowed);
    std::cout << " Passed\n";
}

void test_relative_base_dir_resolved() {
    std::cout << "Test: Relative basedir resolved against working directory..." << std::flush;
    ScratchDir scratch{"config_rel"};
    fs::create_directories(scratch / "project" / "src");

    CurrentPathGuard guard{scratch.path()};
    auto config = Config::parse("---\nbasedir=project\ninclude=src\n");
    config.validate();
    const auto& base = config.options().base_dir;
    assert(base.is_absolute());
    assert(fs::equivalent(base, scratch / "project"));
    assert(base.filename() == "project");

    auto dot = Config::parse("---\nbasedir=.\ninclude=project\n");
    dot.validate();
    assert(fs::equivalent(dot.options().base_dir, scratch.path()));
    assert(!dot.options().base_dir.filename().empty());
    std::cout << " Passed\n";
}

void test_load() {
    std::cout << "Test: Load from file..." << std::flush;
    ScratchDir scratch{"config_load"};
    write_file(scratch / "input.txt", "Header\n---\nbasedir=/srv\ninclude=src\n");
    const auto config = Config::load(scratch / "input.txt");
    assert(config.options().header_text == "Header");

    bool threw = false;
    try {
        (void)Config::load(scratch / "missing.txt");
    } catch (const ConfigError& ex) {
        threw = ex.kind() == ConfigError::Kind::Unreadable && contains(ex.what(), "missing.txt");
    }
    assert(threw);
    std::cout << " Passed\n";
}

} // namespace

int main() {
    std::ostringstream log;
    mdpack::Logger::instance().set_output(&log);
    try {
        test_header_and_directives();
        test_keys_and_values_are_normalized();
        test_ignored_lines();
        test_include_order_preserved();
        test_crlf_input();
        test_missing_separator();
        test_structured_exclusions();
        test_scheme_detection();
        test_heading_directive();
        test_validate_errors();
        test_relative_base_dir_resolved();
        test_load();
        std::cout << "\nAll config tests passed successfully!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
