// clex: tokenize a C89 source file and print the token stream.
//
//     clex [options] <file.c>
//
// Exit status: 0 when the scan completes (recoverable lexical errors
// included), 1 for usage or I/O errors, 2 when the lexer halts.

#include <clex/lang/lexer.hpp>
#include <clex/log.hpp>
#include <clex/source.hpp>

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace clex;

namespace {

const char* kUsage =
    "usage: clex [options] <file.c>\n"
    "\n"
    "options:\n"
    "  --line-comments     accept // comments\n"
    "  --keep-comments     emit comments as tokens\n"
    "  --long-long         accept ll/LL integer suffixes\n"
    "  --format=FORMAT     tuple (default) or table\n"
    "  --log-level=LEVEL   trace, debug, info, warn or error\n"
    "  --verbose           same as --log-level=debug\n"
    "  --quiet             same as --log-level=error\n"
    "  --no-color          disable colored log output\n"
    "  --help              show this message\n";

struct CliArgs {
    std::string path;
    LexOptions lex;
    std::string format = "tuple";
    bool help = false;
};

Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            args.help = true;
        } else if (a == "--line-comments") {
            args.lex.allow_line_comments = true;
        } else if (a == "--keep-comments") {
            args.lex.keep_comments = true;
        } else if (a == "--long-long") {
            args.lex.allow_long_long = true;
        } else if (a.rfind("--format=", 0) == 0) {
            args.format = a.substr(9);
            if (args.format != "tuple" && args.format != "table") {
                return ClexError{ClexError::InvalidArg,
                    "unknown output format '" + args.format + "'",
                    "expected --format=tuple or --format=table"};
            }
        } else if (a.rfind("--log-level=", 0) == 0) {
            CLEX_TRY_ASSIGN(lvl, log::parse_level(a.substr(12)));
            log::set_level(lvl);
        } else if (a == "--verbose") {
            log::set_level(log::Debug);
        } else if (a == "--quiet") {
            log::set_level(log::Error);
        } else if (a == "--no-color") {
            log::set_color_enabled(false);
        } else if (!a.empty() && a[0] == '-') {
            return ClexError{ClexError::InvalidArg,
                "unknown option '" + a + "'", "run 'clex --help' for usage"};
        } else if (args.path.empty()) {
            args.path = a;
        } else {
            return ClexError{ClexError::InvalidArg,
                "more than one input file given",
                "clex scans exactly one file per run"};
        }
    }

    if (!args.help && args.path.empty()) {
        return ClexError{ClexError::InvalidArg, "no input file specified",
                         "usage: clex [options] <file.c>"};
    }
    return Result<CliArgs>::ok(std::move(args));
}

// Printable form of a lexeme or decoded literal
std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        case '\\': out += "\\\\"; break;
        case '"':  out += "\\\""; break;
        default:
            if (u < 0x20 || u >= 0x7F) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02X", u);
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

const char* base_name(IntegerBase b) {
    switch (b) {
    case IntegerBase::Decimal: return "dec";
    case IntegerBase::Octal:   return "oct";
    case IntegerBase::Hex:     return "hex";
    }
    return "?";
}

std::string value_details(const Token& t) {
    if (auto iv = t.integer()) {
        std::string s = std::to_string(iv->value) + " " + base_name(iv->base);
        if (iv->is_unsigned) s += " unsigned";
        if (iv->is_long) s += " long";
        if (iv->is_long_long) s += " long-long";
        return s;
    }
    if (auto fv = t.floating()) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%g", fv->value);
        std::string s = buf;
        if (fv->suffix == FloatSuffix::Float) s += " float";
        if (fv->suffix == FloatSuffix::LongDouble) s += " long-double";
        return s;
    }
    if (auto lit = t.literal()) {
        if (t.kind == TokenKind::CharacterConstant) {
            return std::to_string(lit->char_value());
        }
        return "\"" + escape(lit->bytes) + "\"";
    }
    if (t.kind == TokenKind::Punctuator) {
        return punctuator_class(t.text) == PunctClass::Delimiter ? "delimiter"
                                                                 : "operator";
    }
    if (t.kind == TokenKind::PreprocessorDirective) {
        return "#" + directive_name(t);
    }
    if (t.error) return diagnostic_kind_name(*t.error);
    return "";
}

void print_tuple(const std::vector<Token>& tokens) {
    for (const auto& t : tokens) {
        if (t.kind == TokenKind::EndOfFile) continue;
        std::cout << "(" << t.pos.line << ", " << token_kind_name(t.kind)
                  << ", " << escape(t.text) << ")\n";
    }
}

void print_table(const std::vector<Token>& tokens) {
    for (const auto& t : tokens) {
        std::string loc = std::to_string(t.pos.line) + ":" + std::to_string(t.pos.col);
        std::cout << "  " << loc << std::string(loc.size() < 8 ? 8 - loc.size() : 1, ' ')
                  << token_kind_name(t.kind) << "  \"" << escape(t.text) << "\"";
        std::string details = value_details(t);
        if (!details.empty()) std::cout << "  [" << details << "]";
        std::cout << "\n";
    }
}

Status run(const CliArgs& args) {
    CLEX_TRY_ASSIGN(source, SourceFile::load(args.path));

    LexResult result = lex(source.text(), source.path(), args.lex);

    if (args.format == "table") {
        print_table(result.tokens);
    } else {
        print_tuple(result.tokens);
    }

    for (const auto& d : result.diagnostics) {
        std::cerr << d.render(source) << "\n";
    }

    size_t recoverable = result.diagnostics.size() - (result.fatal() ? 1 : 0);
    if (recoverable > 0) {
        log::warn("%s: %zu recoverable lexical error(s)", source.path().c_str(),
                  recoverable);
    }
    log::info("%s: %zu tokens, %zu diagnostics", source.path().c_str(),
              result.tokens.size(), result.diagnostics.size());

    return result.status();
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << parsed.error().format() << "\n";
        return parsed.error().exit_code();
    }
    if (parsed.value().help) {
        std::cout << kUsage;
        return 0;
    }

    auto status = run(parsed.value());
    if (status.is_err()) {
        // A halted scan was already reported by its rendered diagnostic
        if (!status.is_err(ClexError::Lex)) {
            std::cerr << status.error().format() << "\n";
        }
        return status.error().exit_code();
    }
    return 0;
}
