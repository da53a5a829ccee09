#include <lexforge/lang/tokenizer.hpp>
#include <lexforge/lang/error_collector.hpp>
#include <lexforge/lang/position.hpp>
#include <lexforge/config.hpp>
#include <lexforge/log.hpp>

namespace lexforge {

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

Tokenizer Tokenizer::with_config(TokenizerConfig config) {
    return Tokenizer(config);
}

Result<Tokenizer> Tokenizer::from_config(const Config& config) {
    Tokenizer t(config.tokenizer);
    for (size_t i = 0; i < config.scanners.size(); ++i) {
        auto r = t.add_scanner(config.scanners[i]);
        if (r.is_err()) {
            LexError err = std::move(r).error();
            err.code = LexError::Config;
            err.message = "scanner #" + std::to_string(i + 1) + ": " + err.message;
            return err;
        }
    }
    return Result<Tokenizer>::ok(std::move(t));
}

Status Tokenizer::add_regex_scanner(const std::string& pattern, std::string token_type,
                                    std::optional<std::string> sub_type) {
    RegexScanner s;
    s.pattern = pattern;
    s.token_type = std::move(token_type);
    s.sub_type = std::move(sub_type);
    return add_scanner(std::move(s));
}

Status Tokenizer::add_symbol_scanner(const std::string& literal, std::string token_type,
                                     std::optional<std::string> sub_type) {
    return add_scanner(SymbolScanner{literal, std::move(token_type), std::move(sub_type)});
}

Status Tokenizer::add_block_scanner(const std::string& open, const std::string& close,
                                    std::string token_type,
                                    std::optional<std::string> sub_type,
                                    bool allow_nesting, bool raw_mode,
                                    bool include_delimiters) {
    BlockScanner s;
    s.open = open;
    s.close = close;
    s.token_type = std::move(token_type);
    s.sub_type = std::move(sub_type);
    s.allow_nesting = allow_nesting;
    s.raw_mode = raw_mode;
    s.include_delimiters = include_delimiters;
    return add_scanner(std::move(s));
}

Status Tokenizer::add_scanner(ScannerDefinition def) {
    if (auto* rx = std::get_if<RegexScanner>(&def)) {
        auto compiled = make_regex_scanner(rx->pattern, rx->token_type, rx->sub_type);
        if (compiled.is_err()) {
            log::debug("rejected regex scanner: %s", compiled.error().message.c_str());
            return std::move(compiled).error();
        }
        def = std::move(compiled).value();
    }

    auto valid = validate_scanner(def);
    if (valid.is_err()) {
        log::debug("rejected %s scanner: %s", scanner_kind_name(def),
                   valid.error().message.c_str());
        return valid;
    }

    log::debug("registered %s scanner #%zu -> %s", scanner_kind_name(def),
               scanners_.size() + 1, scanner_token_type(def).c_str());
    scanners_.push_back(std::move(def));
    return ok_status();
}

// ---------------------------------------------------------------------------
// Dispatch loop
// ---------------------------------------------------------------------------

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Skip one whole UTF-8 sequence so an unmatched multi-byte character is
// reported once
size_t next_char(std::string_view input, size_t pos) {
    ++pos;
    while (pos < input.size() &&
           (static_cast<unsigned char>(input[pos]) & 0xC0) == 0x80) {
        ++pos;
    }
    return pos;
}

struct Scan {
    const TokenizerConfig& config;
    const std::vector<ScannerDefinition>& scanners;
    std::string_view input;
    size_t cursor = 0;
    PositionTracker tracker;
    ErrorCollector errors;
    std::vector<Token> tokens;

    Scan(const TokenizerConfig& cfg, const std::vector<ScannerDefinition>& s,
         std::string_view in)
        : config(cfg), scanners(s), input(in),
          tracker(in, cfg.track_token_positions), errors(cfg) {}

    bool at_end() const { return cursor >= input.size(); }

    void emit(std::string type, const std::optional<std::string>& sub_type, Span value) {
        Token t;
        t.type = std::move(type);
        t.sub_type = sub_type;
        t.value = std::string(input.substr(value.begin, value.size()));
        t.pos = tracker.at(value.begin);
        tokens.push_back(std::move(t));
    }

    ErrorCollector::Verdict fail(ScanError err) {
        err.pos = tracker.at(err.pos.offset);
        return errors.record(std::move(err));
    }

    void scan_whitespace() {
        size_t end = cursor;
        while (end < input.size() && is_space(input[end])) ++end;
        if (config.tokenize_whitespace) {
            emit(kWhitespaceType, std::nullopt, {cursor, end});
        }
        cursor = end;
    }

    // Returns false when scanning has to stop
    bool scan_next() {
        for (const auto& def : scanners) {
            auto outcome = match_scanner(def, input, cursor);
            if (!outcome) continue;

            if (outcome->is_err()) {
                // Nothing after an unterminated block can be scanned reliably
                fail(std::move(*outcome).error());
                cursor = input.size();
                return false;
            }

            const ScanMatch& m = outcome->value();
            emit(scanner_token_type(def), scanner_sub_type(def), m.value);
            cursor = m.span.end;
            return true;
        }

        size_t end = next_char(input, cursor);
        auto verdict = fail(ScanError::unmatched_input(
            cursor, std::string(input.substr(cursor, end - cursor))));
        cursor = end;
        return verdict == ErrorCollector::Verdict::Continue;
    }

    void run() {
        while (!at_end()) {
            if (is_space(input[cursor])) {
                scan_whitespace();
                continue;
            }
            if (!scan_next()) break;
        }
    }
};

} // anonymous namespace

TokenizeResult Tokenizer::tokenize(std::string_view input) const {
    Scan scan(config_, scanners_, input);
    scan.run();

    if (!scan.errors.empty()) {
        if (!scan.at_end()) {
            log::debug("scan aborted at offset %zu after %zu error(s)",
                       scan.cursor, scan.errors.count());
        }
        return TokenizeResult::err(scan.errors.take());
    }

    log::trace("tokenized %zu bytes into %zu token(s)", input.size(), scan.tokens.size());
    return TokenizeResult::ok(std::move(scan.tokens));
}

} // namespace lexforge
