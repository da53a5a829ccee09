#pragma once

#include <lexforge/lang/scanner.hpp>
#include <lexforge/lang/tokenizer_config.hpp>
#include <lexforge/result.hpp>
#include <string>
#include <vector>

namespace lexforge {

// A tokenizer described by a TOML rule file:
//
//   [tokenizer]                     options, all optional
//   [[scanner]]                     one table per scanner, in precedence order
//
// Regex scanners are stored uncompiled; Tokenizer::from_config compiles them.
struct Config {
    TokenizerConfig tokenizer;
    // Track which options were explicitly set (for merge)
    bool tokenize_whitespace_set = false;
    bool continue_on_error_set = false;
    bool error_tolerance_limit_set = false;
    bool track_token_positions_set = false;

    std::vector<ScannerDefinition> scanners;

    // Load from a TOML rule file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Layer another rule file on top: its explicitly set options win and its
    // scanners are appended after ours, so ours keep precedence.
    void merge(const Config& other);
};

} // namespace lexforge
