#include <clex/lang/matcher.hpp>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <unordered_map>

namespace clex {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_octal(char c) { return c >= '0' && c <= '7'; }
bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_continue(char c) {
    return is_ident_start(c) || is_digit(c);
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Backslash-newline (or backslash-CRLF) splice at the cursor
size_t splice_length(const Cursor& cur) {
    if (cur.peek() != '\\') return 0;
    if (cur.peek(1) == '\n') return 2;
    if (cur.peek(1) == '\r' && cur.peek(2) == '\n') return 3;
    return 0;
}

std::string take_while(Cursor& cur, bool (*pred)(char)) {
    std::string out;
    while (!cur.at_end() && pred(cur.peek())) {
        out += cur.advance();
    }
    return out;
}

// Accumulate `digits` in `base`; false on 64-bit overflow
bool accumulate(const std::string& digits, unsigned base, std::uint64_t& out) {
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    out = 0;
    for (char c : digits) {
        auto d = static_cast<std::uint64_t>(digit_value(c));
        if (out > (max - d) / base) return false;
        out = out * base + d;
    }
    return true;
}

const std::unordered_map<char, char>& simple_escapes() {
    static const std::unordered_map<char, char> table = {
        {'n', '\n'}, {'t', '\t'}, {'v', '\v'}, {'b', '\b'},
        {'r', '\r'}, {'f', '\f'}, {'a', '\a'}, {'\\', '\\'},
        {'\'', '\''}, {'"', '"'}, {'?', '?'},
    };
    return table;
}

// Decode one escape sequence; the cursor sits just past the backslash.
// Returns false for an unknown or out-of-range escape. A newline is
// never consumed so the caller can report the literal as unterminated.
bool decode_escape(Cursor& cur, std::string& out) {
    if (cur.at_end() || cur.peek() == '\n') return false;

    char c = cur.peek();
    auto& simple = simple_escapes();
    auto it = simple.find(c);
    if (it != simple.end()) {
        cur.advance();
        out += it->second;
        return true;
    }

    if (is_octal(c)) {
        unsigned value = 0;
        for (int i = 0; i < 3 && is_octal(cur.peek()); ++i) {
            value = value * 8 + static_cast<unsigned>(cur.advance() - '0');
        }
        if (value > 0xFF) return false;
        out += static_cast<char>(value);
        return true;
    }

    if (c == 'x') {
        cur.advance();
        if (!is_hex(cur.peek())) return false;
        unsigned value = 0;
        bool overflow = false;
        while (is_hex(cur.peek())) {
            value = value * 16 + static_cast<unsigned>(digit_value(cur.advance()));
            if (value > 0xFF) overflow = true;
        }
        if (overflow) return false;
        out += static_cast<char>(value);
        return true;
    }

    cur.advance();
    return false;
}

// Shared body of character constants and string literals
std::optional<Match> match_quoted(Cursor& cur, char quote, TokenKind kind,
                                  DiagnosticKind unterminated) {
    if (cur.peek() != quote) return std::nullopt;
    cur.advance();

    if (quote == '\'' && cur.peek() == '\'') {
        cur.advance();
        return Match::fail(DiagnosticKind::EmptyCharacterConstant,
                           "empty character constant");
    }

    std::string bytes;
    std::string bad_escape;
    for (;;) {
        if (cur.at_end() || cur.peek() == '\n') {
            return Match::fail(unterminated,
                std::string("missing terminating ") + quote + " character");
        }
        char c = cur.peek();
        if (c == quote) {
            cur.advance();
            break;
        }
        if (c == '\\') {
            if (size_t n = splice_length(cur)) {
                cur.advance(n);
                continue;
            }
            size_t esc_start = cur.offset();
            cur.advance();
            if (!decode_escape(cur, bytes) && bad_escape.empty()) {
                bad_escape = "\\" + cur.slice(esc_start + 1);
            }
            continue;
        }
        bytes += cur.advance();
    }

    if (!bad_escape.empty()) {
        return Match::fail(DiagnosticKind::InvalidEscapeSequence,
                           "invalid escape sequence '" + bad_escape + "'");
    }
    return Match::ok(kind, LiteralBytes{std::move(bytes)});
}

Match invalid_number(const std::string& msg) {
    return Match::fail(DiagnosticKind::InvalidNumericConstant, msg);
}

std::optional<Match> match_hex_number(Cursor& cur, const LexOptions& opts) {
    size_t start = cur.offset();
    cur.advance(2); // 0x

    std::string digits = take_while(cur, is_hex);
    std::string suffix = take_while(cur, is_ident_continue);

    if (digits.empty()) {
        return invalid_number("hexadecimal constant '" + cur.slice(start) +
                              "' has no digits");
    }

    IntegerValue v;
    v.base = IntegerBase::Hex;
    if (!parse_integer_suffix(suffix, opts, v)) {
        return invalid_number("invalid suffix '" + suffix +
                              "' on integer constant");
    }
    if (!accumulate(digits, 16, v.value)) {
        return invalid_number("integer constant '" + cur.slice(start) +
                              "' is too large");
    }
    return Match::ok(TokenKind::IntegerConstant, v);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Trivia
// ---------------------------------------------------------------------------

bool skip_whitespace(Cursor& cur) {
    bool newline = false;
    while (!cur.at_end()) {
        char c = cur.peek();
        if (c == '\n') {
            newline = true;
            cur.advance();
        } else if (is_blank(c)) {
            cur.advance();
        } else if (size_t n = splice_length(cur)) {
            cur.advance(n);
        } else {
            break;
        }
    }
    return newline;
}

std::optional<Match> match_comment(Cursor& cur, const LexOptions& opts) {
    if (cur.peek() != '/') return std::nullopt;

    if (cur.peek(1) == '*') {
        cur.advance(2);
        while (!cur.at_end()) {
            if (cur.consume("*/")) return Match::ok(TokenKind::Comment);
            cur.advance();
        }
        return Match::fail(DiagnosticKind::UnterminatedComment,
                           "unterminated block comment");
    }

    if (cur.peek(1) == '/' && opts.allow_line_comments) {
        while (!cur.at_end() && cur.peek() != '\n') {
            cur.advance();
        }
        return Match::ok(TokenKind::Comment);
    }

    return std::nullopt;
}

std::optional<Match> match_directive(Cursor& cur, const LexOptions&) {
    if (cur.peek() != '#') return std::nullopt;

    while (!cur.at_end() && cur.peek() != '\n') {
        if (size_t n = splice_length(cur)) {
            cur.advance(n);
        } else {
            cur.advance();
        }
    }
    return Match::ok(TokenKind::PreprocessorDirective);
}

// ---------------------------------------------------------------------------
// Token recognizers
// ---------------------------------------------------------------------------

std::optional<Match> match_identifier(Cursor& cur, const LexOptions&) {
    if (!is_ident_start(cur.peek())) return std::nullopt;

    // A backslash-newline inside the name joins its halves ("in\<nl>t" is int)
    std::string text;
    for (;;) {
        size_t splice = splice_length(cur);
        if (splice && is_ident_continue(cur.peek(splice))) cur.advance(splice);
        if (!is_ident_continue(cur.peek())) break;
        text += cur.advance();
    }
    if (c89_keywords().count(text)) {
        return Match::ok(TokenKind::Keyword);
    }
    return Match::ok(TokenKind::Identifier);
}

std::optional<Match> match_number(Cursor& cur, const LexOptions& opts) {
    char c = cur.peek();
    bool leading_dot = (c == '.' && is_digit(cur.peek(1)));
    if (!is_digit(c) && !leading_dot) return std::nullopt;

    if (c == '0' && (cur.peek(1) == 'x' || cur.peek(1) == 'X')) {
        return match_hex_number(cur, opts);
    }

    size_t start = cur.offset();
    bool is_float = false;
    bool empty_exponent = false;

    std::string int_part = take_while(cur, is_digit);
    if (cur.peek() == '.') {
        is_float = true;
        cur.advance();
        take_while(cur, is_digit);
    }
    if (cur.peek() == 'e' || cur.peek() == 'E') {
        auto m = cur.mark();
        cur.advance();
        if (cur.peek() == '+' || cur.peek() == '-') cur.advance();
        if (is_digit(cur.peek())) {
            take_while(cur, is_digit);
            is_float = true;
        } else {
            // Not an exponent; leave the letters to the suffix scan
            cur.rewind(m);
            empty_exponent = true;
        }
    }

    std::string body = cur.slice(start);
    std::string suffix = take_while(cur, is_ident_continue);

    if (empty_exponent && !suffix.empty() &&
        (suffix[0] == 'e' || suffix[0] == 'E')) {
        return invalid_number("exponent has no digits in '" +
                              cur.slice(start) + "'");
    }

    // A plain digit sequence with an f/F suffix is floating (10f)
    if (!is_float && (suffix == "f" || suffix == "F")) {
        is_float = true;
    }

    if (is_float) {
        FloatingValue v;
        if (suffix == "f" || suffix == "F") {
            v.suffix = FloatSuffix::Float;
        } else if (suffix == "l" || suffix == "L") {
            v.suffix = FloatSuffix::LongDouble;
        } else if (!suffix.empty()) {
            return invalid_number("invalid suffix '" + suffix +
                                  "' on floating constant");
        }
        v.value = std::strtod(body.c_str(), nullptr);
        return Match::ok(TokenKind::FloatingConstant, v);
    }

    IntegerValue v;
    unsigned base = 10;
    if (!int_part.empty() && int_part[0] == '0') {
        v.base = IntegerBase::Octal;
        base = 8;
        for (char d : int_part) {
            if (!is_octal(d)) {
                return invalid_number(std::string("invalid digit '") + d +
                                      "' in octal constant");
            }
        }
    }
    if (!parse_integer_suffix(suffix, opts, v)) {
        return invalid_number("invalid suffix '" + suffix +
                              "' on integer constant");
    }
    if (!accumulate(int_part, base, v.value)) {
        return invalid_number("integer constant '" + cur.slice(start) +
                              "' is too large");
    }
    return Match::ok(TokenKind::IntegerConstant, v);
}

std::optional<Match> match_char_constant(Cursor& cur, const LexOptions&) {
    return match_quoted(cur, '\'', TokenKind::CharacterConstant,
                        DiagnosticKind::UnterminatedCharacterConstant);
}

std::optional<Match> match_string_literal(Cursor& cur, const LexOptions&) {
    return match_quoted(cur, '"', TokenKind::StringLiteral,
                        DiagnosticKind::UnterminatedStringLiteral);
}

std::optional<Match> match_punctuator(Cursor& cur, const LexOptions&) {
    // Longest form first: <<= before << before <
    for (size_t len = kMaxPunctuatorLength; len > 0; --len) {
        if (!cur.has(len - 1)) continue;
        std::string candidate = cur.source().substr(cur.offset(), len);
        if (c89_punctuators(len).count(candidate)) {
            cur.advance(len);
            return Match::ok(TokenKind::Punctuator);
        }
    }
    return std::nullopt;
}

Match match_unknown(Cursor& cur) {
    auto c = static_cast<unsigned char>(cur.advance());
    char buf[64];
    if (std::isprint(c)) {
        std::snprintf(buf, sizeof(buf), "unknown character '%c'", c);
    } else {
        std::snprintf(buf, sizeof(buf), "stray byte 0x%02X in program", c);
    }
    return Match::fail(DiagnosticKind::UnknownCharacter, buf);
}

const std::vector<Rule>& token_rules() {
    // Numbers precede punctuators so ".5" is not lexed as "." "5"
    static const std::vector<Rule> rules = {
        {"identifier", match_identifier},
        {"number",     match_number},
        {"character",  match_char_constant},
        {"string",     match_string_literal},
        {"punctuator", match_punctuator},
    };
    return rules;
}

bool parse_integer_suffix(const std::string& suffix, const LexOptions& opts,
                          IntegerValue& v) {
    bool seen_u = false;
    bool seen_l = false;
    size_t i = 0;
    while (i < suffix.size()) {
        char c = suffix[i];
        if ((c == 'u' || c == 'U') && !seen_u) {
            seen_u = true;
            ++i;
        } else if ((c == 'l' || c == 'L') && !seen_l) {
            seen_l = true;
            if (i + 1 < suffix.size() && suffix[i + 1] == c) {
                if (!opts.allow_long_long) return false;
                v.is_long_long = true;
                i += 2;
            } else {
                v.is_long = true;
                ++i;
            }
        } else {
            return false;
        }
    }
    v.is_unsigned = seen_u;
    return true;
}

} // namespace clex
