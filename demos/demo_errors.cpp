// demo_errors.cpp
//
// A small standalone program that exercises LexError, Result<T>, ScanError and
// the logging system against a rule file and an input file on disk:
//
//     ./lexforge-errors                                  # no args -> usage error
//     ./lexforge-errors ../tests/fixtures/block_rules.toml ../tests/fixtures/sample.txt
//     ./lexforge-errors missing.toml input.txt           # bad path -> IO error
//
// Watch stderr for colored log output and formatted diagnostics.

#include <lexforge/config.hpp>
#include <lexforge/lang/tokenizer.hpp>
#include <lexforge/log.hpp>
#include <lexforge/result.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace lexforge;

struct Args {
    std::string rules;
    std::string input;
};

Result<Args> parse_args(int argc, char** argv) {
    if (argc < 3) {
        return LexError{
            LexError::InvalidArg,
            "expected a rule file and an input file",
            "usage: lexforge-errors <rules.toml> <input>"
        };
    }
    return Result<Args>::ok(Args{argv[1], argv[2]});
}

Result<std::string> read_input(const std::string& raw) {
    fs::path p(raw);
    if (!fs::is_regular_file(p)) {
        return LexError{
            LexError::NotFound,
            "input is not a regular file: " + raw,
            "double-check the path and try again"
        };
    }
    std::ifstream in(p);
    if (!in.is_open()) {
        return LexError{LexError::IO, "could not open file: " + raw, "check file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

// Everything that can fail before scanning starts. Each LEXFORGE_TRY
// short-circuits with the error of the step that failed.
Result<Tokenizer> prepare(const Args& args) {
    auto config = Config::load(args.rules);
    LEXFORGE_TRY(config);

    log::info("loaded %zu scanner(s) from %s", config.value().scanners.size(),
              args.rules.c_str());

    return Tokenizer::from_config(config.value());
}

int main(int argc, char** argv) {
    // Turn on verbose logging so registration and scan details are visible
    log::set_level(log::Trace);
    log::trace("demo starting, argc = %d", argc);

    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 1;
    }

    auto tokenizer = prepare(args.value());
    if (tokenizer.is_err()) {
        log::error("setup failed");
        std::cerr << "\n" << tokenizer.error().format() << "\n";
        return 1;
    }

    auto input = read_input(args.value().input);
    if (input.is_err()) {
        std::cerr << input.error().format() << "\n";
        return 1;
    }
    log::info("input is %zu bytes", input.value().size());

    auto result = tokenizer.value().tokenize(input.value());
    if (result.is_ok()) {
        std::cout << "tokens: " << result.value().size() << "\n";
        return 0;
    }

    // Scan failures are values: print every one that was collected
    const auto& errors = result.error();
    log::warn("%zu scan error(s)", errors.size());
    for (const auto& e : errors) {
        std::cerr << "\n" << e.format(args.value().input) << "\n";
    }
    return 2;
}
