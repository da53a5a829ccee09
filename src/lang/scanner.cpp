#include <lexforge/lang/scanner.hpp>
#include <lexforge/lang/block_match.hpp>
#include <re2/re2.h>

namespace lexforge {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

LexError invalid(std::string msg, std::string hint = "") {
    return LexError{LexError::InvalidArg, std::move(msg), std::move(hint)};
}

Status check_token_type(const std::string& type) {
    if (type.empty()) {
        return invalid("scanner token type must not be empty");
    }
    return ok_status();
}

std::optional<MatchResult> match_regex(const RegexScanner& s, std::string_view input,
                                       size_t offset) {
    if (!s.re) return std::nullopt;

    // Match against the remaining input so '^' binds to the cursor
    re2::StringPiece rest(input.data() + offset, input.size() - offset);
    re2::StringPiece m;
    if (!s.re->Match(rest, 0, rest.size(), re2::RE2::ANCHOR_START, &m, 1)) {
        return std::nullopt;
    }
    // An empty match would never advance the cursor
    auto len = static_cast<size_t>(m.size());
    if (len == 0) return std::nullopt;

    ScanMatch sm;
    sm.span = {offset, offset + len};
    sm.value = sm.span;
    return MatchResult::ok(sm);
}

std::optional<MatchResult> match_symbol(const SymbolScanner& s, std::string_view input,
                                        size_t offset) {
    if (input.compare(offset, s.literal.size(), s.literal) != 0) {
        return std::nullopt;
    }
    ScanMatch sm;
    sm.span = {offset, offset + s.literal.size()};
    sm.value = sm.span;
    return MatchResult::ok(sm);
}

} // anonymous namespace

Result<RegexScanner> make_regex_scanner(const std::string& pattern,
                                        std::string token_type,
                                        std::optional<std::string> sub_type) {
    if (pattern.empty()) {
        return invalid("regex pattern must not be empty");
    }

    re2::RE2::Options opts;
    opts.set_log_errors(false);
    auto re = std::make_shared<const re2::RE2>(pattern, opts);
    if (!re->ok()) {
        return invalid("invalid regex pattern '" + pattern + "': " + re->error(),
                       "patterns use RE2 syntax");
    }

    RegexScanner s;
    s.pattern = pattern;
    s.re = std::move(re);
    s.token_type = std::move(token_type);
    s.sub_type = std::move(sub_type);
    return Result<RegexScanner>::ok(std::move(s));
}

Status validate_scanner(const ScannerDefinition& def) {
    LEXFORGE_TRY(check_token_type(scanner_token_type(def)));

    return std::visit(overloaded{
        [](const RegexScanner& s) -> Status {
            if (s.pattern.empty()) {
                return invalid("regex pattern must not be empty");
            }
            return ok_status();
        },
        [](const SymbolScanner& s) -> Status {
            if (s.literal.empty()) {
                return invalid("symbol literal must not be empty");
            }
            return ok_status();
        },
        [](const BlockScanner& s) -> Status {
            if (s.open.empty() || s.close.empty()) {
                return invalid("block delimiters must not be empty",
                               "open='" + s.open + "' close='" + s.close + "'");
            }
            if (s.allow_nesting && s.open == s.close) {
                return invalid("nesting block '" + s.open +
                               "' has identical open and close delimiters",
                               "disable nesting or use distinct delimiters");
            }
            return ok_status();
        },
    }, def);
}

std::optional<MatchResult> match_scanner(const ScannerDefinition& def,
                                         std::string_view input,
                                         size_t offset) {
    return std::visit(overloaded{
        [&](const RegexScanner& s) { return match_regex(s, input, offset); },
        [&](const SymbolScanner& s) { return match_symbol(s, input, offset); },
        [&](const BlockScanner& s) -> std::optional<MatchResult> {
            if (input.compare(offset, s.open.size(), s.open) != 0) {
                return std::nullopt;
            }
            return match_block(s, input, offset);
        },
    }, def);
}

const std::string& scanner_token_type(const ScannerDefinition& def) {
    return std::visit([](const auto& s) -> const std::string& { return s.token_type; }, def);
}

const std::optional<std::string>& scanner_sub_type(const ScannerDefinition& def) {
    return std::visit([](const auto& s) -> const std::optional<std::string>& {
        return s.sub_type;
    }, def);
}

const char* scanner_kind_name(const ScannerDefinition& def) {
    switch (def.index()) {
    case 0: return "regex";
    case 1: return "symbol";
    case 2: return "block";
    }
    return "unknown";
}

} // namespace lexforge
