#include <lexforge/config.hpp>
#include <lexforge/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <initializer_list>
#include <string_view>

namespace lexforge {

namespace {

LexError scanner_error(size_t index, const toml::table& tbl, const std::string& msg,
                       std::string hint = "") {
    LexError e{LexError::Config,
        "scanner #" + std::to_string(index + 1) + ": " + msg, std::move(hint)};
    e.line = static_cast<int>(tbl.source().begin.line);
    return e;
}

bool key_allowed(std::string_view key, std::initializer_list<std::string_view> allowed) {
    for (auto a : allowed) {
        if (a == key) return true;
    }
    return false;
}

void warn_unknown_keys(const toml::table& tbl, const std::string& where,
                       std::initializer_list<std::string_view> allowed) {
    for (const auto& [key, val] : tbl) {
        (void)val;
        if (!key_allowed(key.str(), allowed)) {
            log::warn("ignoring unknown key '%s' in %s",
                      std::string(key.str()).c_str(), where.c_str());
        }
    }
}

// Reads an optional field of type T; an ill-typed value is an error
template<typename T>
Result<std::optional<T>> read_field(const toml::table& tbl, size_t index,
                                    std::string_view key, const char* type_name) {
    if (!tbl.contains(key)) {
        return Result<std::optional<T>>::ok(std::nullopt);
    }
    auto v = tbl[key].value_exact<T>();
    if (!v) {
        return scanner_error(index, tbl,
            "'" + std::string(key) + "' must be a " + type_name);
    }
    return Result<std::optional<T>>::ok(std::move(v));
}

Result<std::string> require_string(const toml::table& tbl, size_t index,
                                   std::string_view key) {
    auto r = read_field<std::string>(tbl, index, key, "string");
    LEXFORGE_TRY(r);
    if (!r.value()) {
        return scanner_error(index, tbl, "missing required key '" + std::string(key) + "'");
    }
    return Result<std::string>::ok(*r.value());
}

Result<ScannerDefinition> parse_scanner(const toml::table& tbl, size_t index) {
    auto kind = require_string(tbl, index, "kind");
    LEXFORGE_TRY(kind);
    auto type = require_string(tbl, index, "type");
    LEXFORGE_TRY(type);
    auto sub_type = read_field<std::string>(tbl, index, "sub-type", "string");
    LEXFORGE_TRY(sub_type);

    std::string where = "scanner #" + std::to_string(index + 1);

    if (kind.value() == "regex") {
        warn_unknown_keys(tbl, where, {"kind", "type", "sub-type", "pattern"});
        auto pattern = require_string(tbl, index, "pattern");
        LEXFORGE_TRY(pattern);
        RegexScanner s;
        s.pattern = pattern.value();
        s.token_type = type.value();
        s.sub_type = sub_type.value();
        return Result<ScannerDefinition>::ok(std::move(s));
    }

    if (kind.value() == "symbol") {
        warn_unknown_keys(tbl, where, {"kind", "type", "sub-type", "literal"});
        auto literal = require_string(tbl, index, "literal");
        LEXFORGE_TRY(literal);
        SymbolScanner s;
        s.literal = literal.value();
        s.token_type = type.value();
        s.sub_type = sub_type.value();
        return Result<ScannerDefinition>::ok(std::move(s));
    }

    if (kind.value() == "block") {
        warn_unknown_keys(tbl, where, {"kind", "type", "sub-type", "open", "close",
                                       "nesting", "raw", "include-delimiters", "escape"});
        BlockScanner s;
        auto open = require_string(tbl, index, "open");
        LEXFORGE_TRY(open);
        auto close = require_string(tbl, index, "close");
        LEXFORGE_TRY(close);
        s.open = open.value();
        s.close = close.value();
        s.token_type = type.value();
        s.sub_type = sub_type.value();

        auto nesting = read_field<bool>(tbl, index, "nesting", "boolean");
        LEXFORGE_TRY(nesting);
        auto raw = read_field<bool>(tbl, index, "raw", "boolean");
        LEXFORGE_TRY(raw);
        auto include = read_field<bool>(tbl, index, "include-delimiters", "boolean");
        LEXFORGE_TRY(include);
        auto escape = read_field<std::string>(tbl, index, "escape", "string");
        LEXFORGE_TRY(escape);

        if (nesting.value()) s.allow_nesting = *nesting.value();
        if (raw.value()) s.raw_mode = *raw.value();
        if (include.value()) s.include_delimiters = *include.value();
        if (escape.value()) {
            if (escape.value()->size() != 1) {
                return scanner_error(index, tbl, "'escape' must be a single character",
                                     "got \"" + *escape.value() + "\"");
            }
            s.escape = (*escape.value())[0];
        }
        return Result<ScannerDefinition>::ok(std::move(s));
    }

    return scanner_error(index, tbl, "unknown scanner kind '" + kind.value() + "'",
                         "expected \"regex\", \"symbol\" or \"block\"");
}

LexError option_error(const std::string& key, const char* type_name) {
    return LexError{LexError::Config,
        "[tokenizer] " + key + " must be a " + type_name};
}

Status parse_options(const toml::table& opts, Config& cfg) {
    warn_unknown_keys(opts, "[tokenizer]", {"tokenize-whitespace", "continue-on-error",
                                           "error-tolerance-limit", "track-token-positions"});

    struct BoolOption {
        const char* key;
        bool* value;
        bool* set;
    };
    const BoolOption bools[] = {
        {"tokenize-whitespace", &cfg.tokenizer.tokenize_whitespace, &cfg.tokenize_whitespace_set},
        {"continue-on-error", &cfg.tokenizer.continue_on_error, &cfg.continue_on_error_set},
        {"track-token-positions", &cfg.tokenizer.track_token_positions, &cfg.track_token_positions_set},
    };
    for (const auto& opt : bools) {
        if (!opts.contains(opt.key)) continue;
        auto v = opts[opt.key].value_exact<bool>();
        if (!v) return option_error(opt.key, "boolean");
        *opt.value = *v;
        *opt.set = true;
    }

    if (opts.contains("error-tolerance-limit")) {
        auto v = opts["error-tolerance-limit"].value_exact<int64_t>();
        if (!v) return option_error("error-tolerance-limit", "integer");
        if (*v < 0) {
            return LexError{LexError::Config,
                "[tokenizer] error-tolerance-limit must not be negative",
                "got " + std::to_string(*v)};
        }
        cfg.tokenizer.error_tolerance_limit = static_cast<size_t>(*v);
        cfg.error_tolerance_limit_set = true;
    }

    return ok_status();
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        LexError err{LexError::Parse,
            std::string("rule file TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        err.column = static_cast<int>(e.source().begin.column);
        return err;
    }

    Config cfg;

    for (const auto& [key, val] : doc) {
        (void)val;
        if (key.str() != "tokenizer" && key.str() != "scanner") {
            log::warn("ignoring unknown top-level key '%s' in rule file",
                      std::string(key.str()).c_str());
        }
    }

    // [tokenizer] section
    if (doc.contains("tokenizer")) {
        auto opts = doc["tokenizer"].as_table();
        if (!opts) {
            return LexError{LexError::Config, "'tokenizer' must be a table"};
        }
        LEXFORGE_TRY(parse_options(*opts, cfg));
    }

    // [[scanner]] array, in precedence order
    if (doc.contains("scanner")) {
        auto arr = doc["scanner"].as_array();
        if (!arr) {
            return LexError{LexError::Config, "'scanner' must be an array of tables",
                            "declare each scanner with [[scanner]]"};
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            auto tbl = arr->get(i)->as_table();
            if (!tbl) {
                return LexError{LexError::Config,
                    "scanner #" + std::to_string(i + 1) + " is not a table"};
            }
            auto def = parse_scanner(*tbl, i);
            LEXFORGE_TRY(def);
            cfg.scanners.push_back(std::move(def).value());
        }
    }

    log::debug("rule file: %zu scanner(s)", cfg.scanners.size());
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LexError{LexError::IO,
            "cannot open rule file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        return std::move(r.error().located(path));
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.tokenize_whitespace_set) {
        tokenizer.tokenize_whitespace = other.tokenizer.tokenize_whitespace;
        tokenize_whitespace_set = true;
    }
    if (other.continue_on_error_set) {
        tokenizer.continue_on_error = other.tokenizer.continue_on_error;
        continue_on_error_set = true;
    }
    if (other.error_tolerance_limit_set) {
        tokenizer.error_tolerance_limit = other.tokenizer.error_tolerance_limit;
        error_tolerance_limit_set = true;
    }
    if (other.track_token_positions_set) {
        tokenizer.track_token_positions = other.tokenizer.track_token_positions;
        track_token_positions_set = true;
    }

    scanners.insert(scanners.end(), other.scanners.begin(), other.scanners.end());
}

} // namespace lexforge
