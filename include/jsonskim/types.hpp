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

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jsonskim {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenKind {
    EndOfInput,
    StartObject,
    EndObject,
    StartArray,
    EndArray,
    String,
    Number,
    Boolean,
    Null,
    Invalid // Unrecognized literal, raw holds the consumed bytes
};

inline const char *token_kind_to_string(TokenKind kind) {
    switch (kind) {
    case TokenKind::StartObject:
        return "StartObject";
    case TokenKind::EndObject:
        return "EndObject";
    case TokenKind::StartArray:
        return "StartArray";
    case TokenKind::EndArray:
        return "EndArray";
    case TokenKind::String:
        return "String";
    case TokenKind::Number:
        return "Number";
    case TokenKind::Boolean:
        return "Boolean";
    case TokenKind::Null:
        return "Null";
    case TokenKind::Invalid:
        return "Invalid";
    default:
        return "EndOfInput";
    }
}

inline bool is_scalar(TokenKind kind) {
    return kind == TokenKind::String || kind == TokenKind::Number ||
           kind == TokenKind::Boolean || kind == TokenKind::Null;
}

// One token pulled from the scanner. raw aliases the scanned buffer:
// string tokens exclude the quotes, structural tokens hold their single byte.
struct Token {
    TokenKind kind = TokenKind::EndOfInput;
    std::string_view raw;
};

// ============================================================================
// Queries and results
// ============================================================================

// Query name -> dot path, e.g. {"names", "items[*].n"}
using QueryMap = std::map<std::string, std::string>;

// Query name -> matched raw values in document order (zero-copy views)
using Results = std::unordered_map<std::string, std::vector<std::string_view>>;

// Array index value meaning "every element"
constexpr int WILDCARD_INDEX = -1;

// ============================================================================
// Errors
// ============================================================================

// Structural error raised while scanning or extracting
class ParseError : public std::runtime_error {
public:

    ParseError(const std::string &message, size_t offset)
        : std::runtime_error(message + " at offset " + std::to_string(offset)), offset_(offset) {}

    size_t offset() const { return offset_; }

private:

    size_t offset_;
};

} // namespace jsonskim
