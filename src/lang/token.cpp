#include <clex/lang/token.hpp>
#include <cctype>

namespace clex {

// ---------------------------------------------------------------------------
// Keyword and punctuator tables
// ---------------------------------------------------------------------------

const std::unordered_set<std::string>& c89_keywords() {
    static const std::unordered_set<std::string> table = {
        "auto",     "break",    "case",     "char",
        "const",    "continue", "default",  "do",
        "double",   "else",     "enum",     "extern",
        "float",    "for",      "goto",     "if",
        "int",      "long",     "register", "return",
        "short",    "signed",   "sizeof",   "static",
        "struct",   "switch",   "typedef",  "union",
        "unsigned", "void",     "volatile", "while",
    };
    return table;
}

const std::unordered_set<std::string>& c89_punctuators(size_t length) {
    static const std::unordered_set<std::string> three = {
        "<<=", ">>=", "...",
    };
    static const std::unordered_set<std::string> two = {
        "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=",
        "&&", "||", "*=", "/=", "%=", "+=", "-=", "&=", "^=",
        "|=", "##",
    };
    static const std::unordered_set<std::string> one = {
        "[", "]", "(", ")", "{", "}", ".", "&", "*", "+", "-",
        "~", "!", "/", "%", "<", ">", "^", "|", "?", ":", ";",
        "=", ",", "#",
    };
    static const std::unordered_set<std::string> none;

    switch (length) {
    case 3: return three;
    case 2: return two;
    case 1: return one;
    default: return none;
    }
}

PunctClass punctuator_class(const std::string& text) {
    static const std::unordered_set<std::string> delimiters = {
        "(", ")", "[", "]", "{", "}", ";", ",", ":", "...",
    };
    return delimiters.count(text) ? PunctClass::Delimiter : PunctClass::Operator;
}

long LiteralBytes::char_value() const {
    unsigned long v = 0;
    for (char c : bytes) {
        v = (v << 8) | static_cast<unsigned char>(c);
    }
    return static_cast<long>(v);
}

std::string directive_name(const Token& tok) {
    if (tok.kind != TokenKind::PreprocessorDirective) return "";

    const std::string& t = tok.text;
    size_t i = 1; // past '#'
    while (i < t.size()) {
        if (t[i] == ' ' || t[i] == '\t' || t[i] == '\f' || t[i] == '\v') {
            ++i;
        } else if (t[i] == '\\' && i + 1 < t.size() && t[i + 1] == '\n') {
            i += 2;
        } else {
            break;
        }
    }

    std::string name;
    while (i < t.size() &&
           (std::isalnum(static_cast<unsigned char>(t[i])) || t[i] == '_')) {
        name += t[i++];
    }
    return name;
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Keyword:               return "Keyword";
    case TokenKind::Identifier:            return "Identifier";
    case TokenKind::IntegerConstant:       return "IntegerConstant";
    case TokenKind::FloatingConstant:      return "FloatingConstant";
    case TokenKind::CharacterConstant:     return "CharacterConstant";
    case TokenKind::StringLiteral:         return "StringLiteral";
    case TokenKind::Punctuator:            return "Punctuator";
    case TokenKind::PreprocessorDirective: return "PreprocessorDirective";
    case TokenKind::Comment:               return "Comment";
    case TokenKind::Error:                 return "Error";
    case TokenKind::EndOfFile:             return "EndOfFile";
    }
    return "Unknown";
}

const char* diagnostic_kind_name(DiagnosticKind k) {
    switch (k) {
    case DiagnosticKind::InvalidNumericConstant:        return "InvalidNumericConstant";
    case DiagnosticKind::EmptyCharacterConstant:        return "EmptyCharacterConstant";
    case DiagnosticKind::UnterminatedCharacterConstant: return "UnterminatedCharacterConstant";
    case DiagnosticKind::InvalidEscapeSequence:         return "InvalidEscapeSequence";
    case DiagnosticKind::UnterminatedStringLiteral:     return "UnterminatedStringLiteral";
    case DiagnosticKind::UnknownCharacter:              return "UnknownCharacter";
    case DiagnosticKind::UnterminatedComment:           return "UnterminatedComment";
    case DiagnosticKind::InternalError:                 return "InternalError";
    }
    return "Unknown";
}

} // namespace clex
