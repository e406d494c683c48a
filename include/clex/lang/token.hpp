#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>

namespace clex {

// Source position of a token's first character
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
    size_t offset = 0;  // byte offset into the source buffer
};

enum class TokenKind {
    Keyword,
    Identifier,
    IntegerConstant,
    FloatingConstant,
    CharacterConstant,
    StringLiteral,
    Punctuator,
    PreprocessorDirective,  // whole directive line, uninterpreted
    Comment,                // only with LexOptions::keep_comments
    Error,                  // raw lexeme of a recoverable lexical error
    EndOfFile
};

// Carried by Error tokens and by diagnostics
enum class DiagnosticKind {
    InvalidNumericConstant,
    EmptyCharacterConstant,
    UnterminatedCharacterConstant,
    InvalidEscapeSequence,
    UnterminatedStringLiteral,
    UnknownCharacter,
    UnterminatedComment,  // fatal
    InternalError         // fatal, scanner made no progress
};

enum class IntegerBase { Decimal, Octal, Hex };

struct IntegerValue {
    std::uint64_t value = 0;
    IntegerBase base = IntegerBase::Decimal;
    bool is_unsigned = false;
    bool is_long = false;
    bool is_long_long = false;  // only with LexOptions::allow_long_long
};

enum class FloatSuffix { None, Float, LongDouble };

struct FloatingValue {
    double value = 0.0;
    FloatSuffix suffix = FloatSuffix::None;
};

// Decoded contents of a character constant or string literal
struct LiteralBytes {
    std::string bytes;

    // Value of a character constant; multi-character constants pack
    // bytes big-endian, each byte taken as unsigned
    long char_value() const;
};

using TokenValue = std::variant<std::monostate, IntegerValue, FloatingValue, LiteralBytes>;

enum class PunctClass { Operator, Delimiter };

struct Token {
    TokenKind kind;
    std::string text;  // exact lexeme
    SourcePos pos;
    TokenValue value;
    std::optional<DiagnosticKind> error;

    bool is_keyword(const char* word) const {
        return kind == TokenKind::Keyword && text == word;
    }
    bool is_punct(const char* p) const {
        return kind == TokenKind::Punctuator && text == p;
    }

    const IntegerValue* integer() const { return std::get_if<IntegerValue>(&value); }
    const FloatingValue* floating() const { return std::get_if<FloatingValue>(&value); }
    const LiteralBytes* literal() const { return std::get_if<LiteralBytes>(&value); }
};

// The 32 reserved words of C89
const std::unordered_set<std::string>& c89_keywords();

// Punctuators of exactly `length` characters (1, 2 or 3); empty set otherwise
const std::unordered_set<std::string>& c89_punctuators(size_t length);

constexpr size_t kMaxPunctuatorLength = 3;

PunctClass punctuator_class(const std::string& text);

// Directive word of a PreprocessorDirective token ("define", "include", ...);
// empty for the null directive or a non-directive token
std::string directive_name(const Token& tok);

const char* token_kind_name(TokenKind k);
const char* diagnostic_kind_name(DiagnosticKind k);

} // namespace clex
