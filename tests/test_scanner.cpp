#include <catch2/catch.hpp>
#include <lexforge/lang/scanner.hpp>
#include <lexforge/lang/tokenizer.hpp>

using namespace lexforge;

// ===== match_scanner =====

TEST_CASE("regex scanner matches anchored at the offset", "[scanner]") {
    auto s = make_regex_scanner("^[0-9]+", "Number", std::nullopt);
    REQUIRE(s.is_ok());
    ScannerDefinition def = s.value();

    auto m = match_scanner(def, "ab123 4", 2);
    REQUIRE(m.has_value());
    REQUIRE(m->is_ok());
    REQUIRE(m->value().span.begin == 2);
    REQUIRE(m->value().span.end == 5);

    REQUIRE_FALSE(match_scanner(def, "ab123", 0).has_value());
}

TEST_CASE("regex scanner without caret is still anchored", "[scanner]") {
    ScannerDefinition def = make_regex_scanner("[a-z]+", "Word", std::nullopt).value();
    REQUIRE_FALSE(match_scanner(def, "12abc", 0).has_value());
    REQUIRE(match_scanner(def, "12abc", 2).has_value());
}

TEST_CASE("empty regex match counts as no match", "[scanner]") {
    ScannerDefinition def = make_regex_scanner("^x*", "Xs", std::nullopt).value();
    REQUIRE_FALSE(match_scanner(def, "abc", 0).has_value());
    REQUIRE(match_scanner(def, "xxa", 0)->value().span.end == 2);
}

TEST_CASE("symbol scanner compares the exact literal", "[scanner]") {
    ScannerDefinition def = SymbolScanner{"->", "Arrow", std::nullopt};
    REQUIRE(match_scanner(def, "a->b", 1)->value().span.end == 3);
    REQUIRE_FALSE(match_scanner(def, "a-b", 1).has_value());
    REQUIRE_FALSE(match_scanner(def, "-", 0).has_value());
}

TEST_CASE("block scanner needs its open delimiter at the offset", "[scanner]") {
    BlockScanner b;
    b.open = "/*";
    b.close = "*/";
    b.token_type = "Comment";
    ScannerDefinition def = b;

    REQUIRE_FALSE(match_scanner(def, "a /* */", 0).has_value());

    auto m = match_scanner(def, "a /* */", 2);
    REQUIRE(m.has_value());
    REQUIRE(m->value().span.end == 7);

    auto bad = match_scanner(def, "/* open", 0);
    REQUIRE(bad.has_value());
    REQUIRE(bad->is_err());
}

TEST_CASE("scanner accessors", "[scanner]") {
    ScannerDefinition def = SymbolScanner{";", "Semicolon", std::string("End")};
    REQUIRE(scanner_token_type(def) == "Semicolon");
    REQUIRE(*scanner_sub_type(def) == "End");
    REQUIRE(std::string(scanner_kind_name(def)) == "symbol");
}

// ===== Registration =====

TEST_CASE("invalid regex is rejected at registration", "[scanner][registration]") {
    Tokenizer t;
    auto r = t.add_regex_scanner("[unclosed", "Broken");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LexError::InvalidArg);
    REQUIRE(r.error().message.find("[unclosed") != std::string::npos);
    REQUIRE(t.scanners().empty());
}

TEST_CASE("empty literals and delimiters are rejected", "[scanner][registration]") {
    Tokenizer t;
    REQUIRE(t.add_regex_scanner("", "Empty").is_err());
    REQUIRE(t.add_symbol_scanner("", "Empty").is_err());
    REQUIRE(t.add_block_scanner("", "}", "Block", std::nullopt, false, false, true).is_err());
    REQUIRE(t.add_block_scanner("{", "", "Block", std::nullopt, false, false, true).is_err());
    REQUIRE(t.scanners().empty());
}

TEST_CASE("empty token type is rejected", "[scanner][registration]") {
    Tokenizer t;
    auto r = t.add_symbol_scanner(";", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "scanner token type must not be empty");
}

TEST_CASE("nesting with identical delimiters is rejected", "[scanner][registration]") {
    Tokenizer t;
    REQUIRE(t.add_block_scanner("\"", "\"", "String", std::nullopt, true, false, true).is_err());
    REQUIRE(t.add_block_scanner("\"", "\"", "String", std::nullopt, false, false, true).is_ok());
    REQUIRE(t.scanners().size() == 1);
}

TEST_CASE("add_scanner compiles regex definitions", "[scanner][registration]") {
    Tokenizer t;
    RegexScanner rx;
    rx.pattern = "^[a-z]+";
    rx.token_type = "Word";
    REQUIRE(t.add_scanner(rx).is_ok());

    auto r = t.tokenize("abc");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()[0].type == "Word");
}

TEST_CASE("registration keeps order", "[scanner][registration]") {
    Tokenizer t;
    REQUIRE(t.add_symbol_scanner("a", "A").is_ok());
    REQUIRE(t.add_regex_scanner("^b", "B").is_ok());
    REQUIRE(t.add_block_scanner("(", ")", "C", std::nullopt, true, false, true).is_ok());
    REQUIRE(t.scanners().size() == 3);
    REQUIRE(scanner_token_type(t.scanners()[0]) == "A");
    REQUIRE(scanner_token_type(t.scanners()[1]) == "B");
    REQUIRE(scanner_token_type(t.scanners()[2]) == "C");
}
