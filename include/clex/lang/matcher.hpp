#pragma once

#include <clex/lang/cursor.hpp>
#include <clex/lang/token.hpp>
#include <optional>
#include <string>
#include <vector>

namespace clex {

// Dialect switches. Defaults are strict C89.
struct LexOptions {
    bool allow_line_comments = false;  // accept // comments
    bool keep_comments = false;        // emit Comment tokens
    bool allow_long_long = false;      // accept ll/LL integer suffixes
};

// What a recognizer found. On success the cursor sits just past the
// lexeme; the caller slices the lexeme from its own start offset.
struct Match {
    TokenKind kind;
    TokenValue value;
    std::optional<DiagnosticKind> error;
    std::string message;

    static Match ok(TokenKind k, TokenValue v = {}) {
        return {k, std::move(v), std::nullopt, ""};
    }
    static Match fail(DiagnosticKind d, std::string msg) {
        return {TokenKind::Error, {}, d, std::move(msg)};
    }
};

// A recognizer either matches at the cursor (and consumes the lexeme) or
// returns nullopt with the cursor untouched.
using Recognizer = std::optional<Match> (*)(Cursor&, const LexOptions&);

struct Rule {
    const char* name;
    Recognizer fn;
};

// Skip blanks, newlines and backslash-newline splices.
// Returns true if a newline ended a logical line.
bool skip_whitespace(Cursor& cur);

// Block comment, or line comment when the dialect allows it.
// An unterminated block comment consumes the rest of the buffer and
// reports UnterminatedComment.
std::optional<Match> match_comment(Cursor& cur, const LexOptions& opts);

// '#' directive up to the end of the logical line. The caller decides
// whether the cursor is at the start of a line.
std::optional<Match> match_directive(Cursor& cur, const LexOptions& opts);

std::optional<Match> match_identifier(Cursor& cur, const LexOptions& opts);
std::optional<Match> match_number(Cursor& cur, const LexOptions& opts);
std::optional<Match> match_char_constant(Cursor& cur, const LexOptions& opts);
std::optional<Match> match_string_literal(Cursor& cur, const LexOptions& opts);
std::optional<Match> match_punctuator(Cursor& cur, const LexOptions& opts);

// Fallback: consumes exactly one character and reports UnknownCharacter
Match match_unknown(Cursor& cur);

// Token recognizers in dispatch priority order
const std::vector<Rule>& token_rules();

// Integer suffix check ("u", "L", "ul", "LU", ...); fills the flags of `v`
bool parse_integer_suffix(const std::string& suffix, const LexOptions& opts,
                          IntegerValue& v);

} // namespace clex
