// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "jsonskim/scanner.hpp"
#include <algorithm>
#include <string>

namespace jsonskim {

static bool is_whitespace(char c) { return c == ' ' || c == '\n' || c == '\t' || c == '\r'; }

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Bytes that end an unrecognized literal
static bool is_delimiter(char c) { return is_whitespace(c) || c == ',' || c == '}' || c == ']'; }

Scanner::Scanner(std::string_view data) : data_(data) {}

void Scanner::skip_whitespace() {
    while (pos_ < data_.size() && is_whitespace(data_[pos_])) {
        ++pos_;
    }
}

bool Scanner::more() {
    skip_whitespace();
    return pos_ < data_.size() && data_[pos_] != '}' && data_[pos_] != ']';
}

std::string_view Scanner::scan_string() {
    ++pos_; // opening quote
    size_t begin = pos_;
    while (pos_ < data_.size() && data_[pos_] != '"') {
        if (data_[pos_] == '\\') {
            ++pos_; // escaped byte is not interpreted
        }
        ++pos_;
    }
    if (pos_ > data_.size()) {
        pos_ = data_.size(); // backslash was the last byte
    }
    size_t end = pos_;
    if (pos_ < data_.size()) {
        ++pos_; // closing quote
    }
    return data_.substr(begin, end - begin);
}

void Scanner::skip_string() {
    skip_whitespace();
    if (pos_ < data_.size() && data_[pos_] == '"') {
        scan_string();
    }
}

Token Scanner::scan_literal(TokenKind kind, size_t width) {
    size_t start = pos_;
    pos_ += std::min(width, data_.size() - pos_);
    return Token{kind, data_.substr(start, pos_ - start)};
}

Token Scanner::scan_number() {
    size_t start = pos_;
    if (data_[pos_] == '-') {
        ++pos_;
    }
    // No exponent support: "1e5" scans as "1" followed by an unrecognized literal
    while (pos_ < data_.size() && (is_digit(data_[pos_]) || data_[pos_] == '.')) {
        ++pos_;
    }
    return Token{TokenKind::Number, data_.substr(start, pos_ - start)};
}

Token Scanner::next() {
    for (;;) {
        skip_whitespace();
        if (pos_ >= data_.size()) {
            return Token{TokenKind::EndOfInput, {}};
        }

        size_t start = pos_;
        char c = data_[pos_];
        switch (c) {
        case ',':
        case ':':
            ++pos_;
            continue;
        case '{':
            ++pos_;
            return Token{TokenKind::StartObject, data_.substr(start, 1)};
        case '}':
            ++pos_;
            return Token{TokenKind::EndObject, data_.substr(start, 1)};
        case '[':
            ++pos_;
            return Token{TokenKind::StartArray, data_.substr(start, 1)};
        case ']':
            ++pos_;
            return Token{TokenKind::EndArray, data_.substr(start, 1)};
        case '"':
            return Token{TokenKind::String, scan_string()};
        case 't':
            return scan_literal(TokenKind::Boolean, 4);
        case 'f':
            return scan_literal(TokenKind::Boolean, 5);
        case 'n':
            return scan_literal(TokenKind::Null, 4);
        default:
            break;
        }

        if (c == '-' || is_digit(c)) {
            return scan_number();
        }

        while (pos_ < data_.size() && !is_delimiter(data_[pos_])) {
            ++pos_;
        }
        return Token{TokenKind::Invalid, data_.substr(start, pos_ - start)};
    }
}

void Scanner::skip_value() {
    Token token = next();
    if (token.kind != TokenKind::StartObject && token.kind != TokenKind::StartArray) {
        return;
    }

    // Depth counting over raw bytes; brackets inside strings do not count
    size_t depth = 1;
    bool inside_string = false;
    while (pos_ < data_.size()) {
        char c = data_[pos_++];
        if (inside_string) {
            if (c == '\\') {
                ++pos_;
            } else if (c == '"') {
                inside_string = false;
            }
            continue;
        }
        switch (c) {
        case '"':
            inside_string = true;
            break;
        case '{':
        case '[':
            ++depth;
            break;
        case '}':
        case ']':
            if (--depth == 0) {
                return;
            }
            break;
        default:
            break;
        }
    }
    pos_ = data_.size();
}

std::string_view Scanner::expect_string() {
    size_t offset = pos_;
    Token token = next();
    if (token.kind != TokenKind::String) {
        throw ParseError(std::string("expected String token, got ") +
                             token_kind_to_string(token.kind),
                         offset);
    }
    return token.raw;
}

void Scanner::expect_end_object() {
    size_t offset = pos_;
    Token token = next();
    if (token.kind != TokenKind::EndObject) {
        throw ParseError(std::string("expected EndObject token, got ") +
                             token_kind_to_string(token.kind),
                         offset);
    }
}

void Scanner::expect_end_array() {
    size_t offset = pos_;
    Token token = next();
    if (token.kind != TokenKind::EndArray) {
        throw ParseError(std::string("expected EndArray token, got ") +
                             token_kind_to_string(token.kind),
                         offset);
    }
}

} // namespace jsonskim
