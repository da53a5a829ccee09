#pragma once

#include <lexforge/lang/scanner.hpp>
#include <lexforge/lang/token.hpp>
#include <lexforge/lang/tokenizer_config.hpp>
#include <lexforge/result.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexforge {

struct Config;

using TokenizeResult = Result<std::vector<Token>, std::vector<ScanError>>;

// Rule-driven tokenizer. Scanners are tried in registration order and the
// first one whose start condition holds at the cursor wins, whatever the
// length of later candidates. Whitespace is handled before any scanner.
//
// tokenize() is const and keeps all scan state local, so one Tokenizer can
// serve concurrent calls once registration is finished.
class Tokenizer {
public:
    Tokenizer() = default;
    explicit Tokenizer(TokenizerConfig config) : config_(config) {}

    static Tokenizer with_config(TokenizerConfig config);

    // Build a tokenizer from a parsed rule file, registering its scanners in
    // file order. Fails with the index of the first rejected scanner.
    static Result<Tokenizer> from_config(const Config& config);

    Status add_regex_scanner(const std::string& pattern, std::string token_type,
                             std::optional<std::string> sub_type = std::nullopt);

    Status add_symbol_scanner(const std::string& literal, std::string token_type,
                              std::optional<std::string> sub_type = std::nullopt);

    Status add_block_scanner(const std::string& open, const std::string& close,
                             std::string token_type,
                             std::optional<std::string> sub_type,
                             bool allow_nesting, bool raw_mode,
                             bool include_delimiters);

    // Generic registration; regex patterns are (re)compiled here.
    Status add_scanner(ScannerDefinition def);

    TokenizeResult tokenize(std::string_view input) const;

    const TokenizerConfig& config() const { return config_; }
    const std::vector<ScannerDefinition>& scanners() const { return scanners_; }

private:
    TokenizerConfig config_;
    std::vector<ScannerDefinition> scanners_;
};

} // namespace lexforge
