#include <catch2/catch.hpp>
#include <lexforge/lang/tokenizer.hpp>

using namespace lexforge;

// Comment, code block, tag and raw string blocks ahead of plain scanners
static Tokenizer block_tokenizer() {
    TokenizerConfig cfg;
    cfg.tokenize_whitespace = true;
    cfg.continue_on_error = true;
    cfg.error_tolerance_limit = 5;
    cfg.track_token_positions = true;
    auto t = Tokenizer::with_config(cfg);

    REQUIRE(t.add_block_scanner("/*", "*/", "Comment", std::string("BlockComment"),
                                false, false, true).is_ok());
    REQUIRE(t.add_block_scanner("{", "}", "CodeBlock", std::nullopt,
                                true, false, true).is_ok());
    REQUIRE(t.add_block_scanner("<", ">", "Tag", std::nullopt,
                                false, false, true).is_ok());
    REQUIRE(t.add_block_scanner("r\"", "\"", "String", std::string("RawString"),
                                false, true, true).is_ok());

    REQUIRE(t.add_regex_scanner("^[a-zA-Z_][a-zA-Z0-9_]*", "Identifier").is_ok());
    REQUIRE(t.add_regex_scanner("^\\d+", "Number").is_ok());
    REQUIRE(t.add_symbol_scanner(";", "Semicolon").is_ok());
    return t;
}

TEST_CASE("simple block comment", "[block_scanner]") {
    auto r = block_tokenizer().tokenize("/* This is a block comment */ var");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 3);
    REQUIRE(toks[0].type == "Comment");
    REQUIRE(toks[0].sub_type == std::optional<std::string>("BlockComment"));
    REQUIRE(toks[0].value == "/* This is a block comment */");
    REQUIRE(toks[0].pos.line == 1);
    REQUIRE(toks[0].pos.col == 1);
    REQUIRE(toks[2].value == "var");
    REQUIRE(toks[2].pos.col == 31);
}

TEST_CASE("nested code blocks", "[block_scanner]") {
    std::string input = "{ outer { inner } block }";
    auto r = block_tokenizer().tokenize(input);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].type == "CodeBlock");
    REQUIRE(r.value()[0].value == input);
    REQUIRE(r.value()[0].value.find("{ inner }") != std::string::npos);
}

TEST_CASE("nested code block spanning the whole input", "[block_scanner]") {
    auto r = block_tokenizer().tokenize("{ a { b } c }");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].value == "{ a { b } c }");
}

TEST_CASE("raw string keeps escape sequences", "[block_scanner]") {
    auto r = block_tokenizer().tokenize(R"(r"This is a raw string with \n and \t escape sequences";)");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].type == "String");
    REQUIRE(*toks[0].sub_type == "RawString");
    REQUIRE(toks[0].value.find("\\n") != std::string::npos);
    REQUIRE(toks[0].value.find("\\t") != std::string::npos);
    REQUIRE(toks[1].type == "Semicolon");
}

TEST_CASE("html-style tags", "[block_scanner]") {
    auto r = block_tokenizer().tokenize("<div>content</div>");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 3);
    REQUIRE(toks[0].type == "Tag");
    REQUIRE(toks[0].value == "<div>");
    REQUIRE(toks[1].type == "Identifier");
    REQUIRE(toks[1].value == "content");
    REQUIRE(toks[2].type == "Tag");
    REQUIRE(toks[2].value == "</div>");
}

TEST_CASE("unterminated block comment", "[block_scanner]") {
    auto r = block_tokenizer().tokenize("/* This comment is not closed properly var");
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.error().empty());
    REQUIRE(r.error()[0].kind == ScanError::UnterminatedBlock);
    REQUIRE(r.error()[0].pos.offset == 0);
}

TEST_CASE("short unterminated comment", "[block_scanner]") {
    auto r = block_tokenizer().tokenize("/* unterminated");
    REQUIRE(r.is_err());
    REQUIRE(r.error().size() == 1);
    REQUIRE(r.error()[0].kind == ScanError::UnterminatedBlock);
    REQUIRE(r.error()[0].pos.offset == 0);
}

TEST_CASE("complex mixed content", "[block_scanner]") {
    auto r = block_tokenizer().tokenize(
        "/* Comment */ { code with /* nested comment */ } <tag>content</tag>");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 7);
    REQUIRE(toks[0].type == "Comment");
    REQUIRE(toks[2].type == "CodeBlock");
    REQUIRE(toks[2].value.find("/* nested comment */") != std::string::npos);
    REQUIRE(toks[4].type == "Tag");
    REQUIRE(toks[5].type == "Identifier");
    REQUIRE(toks[6].type == "Tag");
}

TEST_CASE("whitespace inside blocks", "[block_scanner]") {
    std::string input = "{\n  first line\n  second line\n}";
    auto r = block_tokenizer().tokenize(input);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].type == "CodeBlock");
    REQUIRE(r.value()[0].value == input);
}

TEST_CASE("blocks with excluded delimiters", "[block_scanner]") {
    TokenizerConfig cfg;
    cfg.continue_on_error = true;
    cfg.error_tolerance_limit = 5;
    auto t = Tokenizer::with_config(cfg);
    REQUIRE(t.add_block_scanner("{", "}", "CodeBlock", std::string("WithoutDelimiters"),
                                true, false, false).is_ok());

    auto r = t.tokenize("{ code block content }");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    auto& tok = r.value()[0];
    REQUIRE(tok.type == "CodeBlock");
    REQUIRE(*tok.sub_type == "WithoutDelimiters");
    REQUIRE(tok.value == " code block content ");
    // position of the first character of the value
    REQUIRE(tok.pos.offset == 1);
    REQUIRE(tok.pos.col == 2);
}

TEST_CASE("block after a tag on a later line", "[block_scanner]") {
    auto r = block_tokenizer().tokenize("<a>\n  { x }");
    REQUIRE(r.is_ok());
    auto& block = r.value()[2];
    REQUIRE(block.type == "CodeBlock");
    REQUIRE(block.pos.line == 2);
    REQUIRE(block.pos.col == 3);
}
