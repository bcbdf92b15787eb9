#include <catch2/catch.hpp>
#include <jsonskim/scanner.hpp>
#include <string>
#include <vector>

using namespace jsonskim;

TEST_CASE("jsonskim::scanner::tokens") {
    std::string doc = R"({"a": 1, "b": [true, false, null], "c": "x\"y"})";
    Scanner scanner(doc);

    std::vector<TokenKind> kinds;
    std::vector<std::string> raws;
    for (Token token = scanner.next(); token.kind != TokenKind::EndOfInput;
         token = scanner.next()) {
        kinds.push_back(token.kind);
        raws.emplace_back(token.raw);
    }

    std::vector<TokenKind> expected_kinds = {
        TokenKind::StartObject, TokenKind::String,  TokenKind::Number,   TokenKind::String,
        TokenKind::StartArray,  TokenKind::Boolean, TokenKind::Boolean,  TokenKind::Null,
        TokenKind::EndArray,    TokenKind::String,  TokenKind::String,   TokenKind::EndObject};
    std::vector<std::string> expected_raws = {"{",     "a",    "1", "b", "[",       "true",
                                              "false", "null", "]", "c", "x\\\"y", "}"};
    REQUIRE(kinds == expected_kinds);
    REQUIRE(raws == expected_raws);
    REQUIRE(scanner.at_end());
}

TEST_CASE("jsonskim::scanner::numbers") {
    SECTION("negative with fraction") {
        Scanner scanner("-12.5,");
        Token token = scanner.next();
        REQUIRE(token.kind == TokenKind::Number);
        REQUIRE(token.raw == "-12.5");
    }

    SECTION("exponent is not part of a number") {
        Scanner scanner("1e5]");
        Token number = scanner.next();
        REQUIRE(number.kind == TokenKind::Number);
        REQUIRE(number.raw == "1");
        Token rest = scanner.next();
        REQUIRE(rest.kind == TokenKind::Invalid);
        REQUIRE(rest.raw == "e5");
        REQUIRE(scanner.next().kind == TokenKind::EndArray);
    }
}

TEST_CASE("jsonskim::scanner::whitespace") {
    Scanner scanner("\r\n\t [ \r\n1\t]");
    REQUIRE(scanner.next().kind == TokenKind::StartArray);
    REQUIRE(scanner.more());
    REQUIRE(scanner.next().raw == "1");
    REQUIRE_FALSE(scanner.more());
    scanner.expect_end_array();
}

TEST_CASE("jsonskim::scanner::truncated_literals") {
    SECTION("true cut short") {
        std::string doc = "[tr";
        Scanner scanner(doc);
        REQUIRE(scanner.next().kind == TokenKind::StartArray);
        Token token = scanner.next();
        REQUIRE(token.kind == TokenKind::Boolean);
        REQUIRE(token.raw == "tr");
        REQUIRE(scanner.position() == doc.size());
        REQUIRE(scanner.next().kind == TokenKind::EndOfInput);
    }

    SECTION("false cut short") {
        Scanner scanner("f");
        REQUIRE(scanner.next().raw == "f");
        REQUIRE(scanner.at_end());
    }
}

TEST_CASE("jsonskim::scanner::strings") {
    SECTION("unterminated") {
        Scanner scanner(R"("abc)");
        Token token = scanner.next();
        REQUIRE(token.kind == TokenKind::String);
        REQUIRE(token.raw == "abc");
        REQUIRE(scanner.at_end());
    }

    SECTION("trailing backslash") {
        Scanner scanner("\"ab\\");
        Token token = scanner.next();
        REQUIRE(token.kind == TokenKind::String);
        REQUIRE(scanner.at_end());
    }

    SECTION("skip_string") {
        Scanner scanner(R"(  "a\"b" 7)");
        scanner.skip_string();
        REQUIRE(scanner.next().raw == "7");
    }
}

TEST_CASE("jsonskim::scanner::skip_value") {
    SECTION("nested containers with brackets inside strings") {
        std::string doc = R"({"skip":{"x":[1,{"y":"}]\"["}],"z":{}},"next":2})";
        Scanner scanner(doc);
        REQUIRE(scanner.next().kind == TokenKind::StartObject);
        REQUIRE(scanner.expect_string() == "skip");
        scanner.skip_value();
        REQUIRE(scanner.more());
        REQUIRE(scanner.expect_string() == "next");
        REQUIRE(scanner.next().raw == "2");
        scanner.expect_end_object();
        REQUIRE(scanner.next().kind == TokenKind::EndOfInput);
    }

    SECTION("scalars") {
        Scanner scanner(R"(["a", 12, null, [[]], {}, 3])");
        REQUIRE(scanner.next().kind == TokenKind::StartArray);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(scanner.more());
            scanner.skip_value();
        }
        REQUIRE(scanner.next().raw == "3");
        scanner.expect_end_array();
    }

    SECTION("unclosed container stops at the end") {
        std::string doc = R"({"a":[1,2)";
        Scanner scanner(doc);
        scanner.skip_value();
        REQUIRE(scanner.position() == doc.size());
    }
}

TEST_CASE("jsonskim::scanner::expectations") {
    Scanner scanner(R"({ 5 })");
    REQUIRE(scanner.next().kind == TokenKind::StartObject);
    REQUIRE_THROWS_AS(scanner.expect_string(), ParseError);

    Scanner empty_object("{}");
    REQUIRE(empty_object.next().kind == TokenKind::StartObject);
    REQUIRE_FALSE(empty_object.more());
    REQUIRE_NOTHROW(empty_object.expect_end_object());

    Scanner wrong_close("[}");
    REQUIRE(wrong_close.next().kind == TokenKind::StartArray);
    REQUIRE_THROWS_AS(wrong_close.expect_end_array(), ParseError);

    try {
        Scanner at_end("");
        at_end.expect_end_object();
        FAIL("expected ParseError");
    } catch (const ParseError &e) {
        REQUIRE(e.offset() == 0);
        REQUIRE(std::string(e.what()).find("EndOfInput") != std::string::npos);
    }
}

TEST_CASE("jsonskim::scanner::seek") {
    Scanner scanner(R"([1, 2])");
    scanner.next();
    size_t mark = scanner.position();
    REQUIRE(scanner.next().raw == "1");
    scanner.seek(mark);
    REQUIRE(scanner.next().raw == "1");
    scanner.seek(1000);
    REQUIRE(scanner.at_end());
}
