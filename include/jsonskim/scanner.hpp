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

#pragma once

#include "types.hpp"
#include <cstddef>
#include <string_view>

namespace jsonskim {

// Forward-only pull lexer over an in-memory JSON buffer.
// Commas and colons are consumed as separators and never returned.
// The buffer must outlive the scanner and every token it hands out.
class Scanner {
public:

    explicit Scanner(std::string_view data);

    // Next token, or EndOfInput once the buffer is exhausted
    Token next();

    // True if, after whitespace, the next byte is not '}' or ']' (or the end)
    bool more();

    // Discard one complete value (containers are skipped with bracket counting)
    void skip_value();

    // Discard a quoted string at the current position, if there is one
    void skip_string();

    // Structural assertions, throw ParseError on mismatch
    std::string_view expect_string();
    void expect_end_object();
    void expect_end_array();

    // Cursor access, used for look-ahead that must be undone
    size_t position() const { return pos_; }
    void seek(size_t pos) { pos_ = pos < data_.size() ? pos : data_.size(); }

    size_t size() const { return data_.size(); }
    bool at_end() const { return pos_ >= data_.size(); }

private:

    std::string_view data_;
    size_t pos_ = 0;

    void skip_whitespace();

    // Scan a quoted string and return its contents without the quotes
    std::string_view scan_string();

    // Advance over a fixed-width literal (true/false/null), clamped to the buffer
    Token scan_literal(TokenKind kind, size_t width);

    Token scan_number();
};

} // namespace jsonskim
