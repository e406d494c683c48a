#include <catch2/catch.hpp>
#include <clex/lang/lexer.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

using namespace clex;

static std::string fixture_dir() {
    const char* src = std::getenv("CLEX_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static std::vector<TokenKind> kinds(const LexResult& r) {
    std::vector<TokenKind> out;
    for (auto& t : r.tokens) out.push_back(t.kind);
    return out;
}

// Rebuild the source from token lexemes plus the skipped gaps, checking
// that every gap is only whitespace or comments.
static std::string reconstruct(const LexResult& r, const std::string& source) {
    std::string out;
    size_t at = 0;
    for (auto& t : r.tokens) {
        REQUIRE(t.pos.offset >= at);
        std::string gap = source.substr(at, t.pos.offset - at);
        auto gap_result = lex(gap);
        REQUIRE(gap_result.tokens.size() == 1);
        out += gap;
        REQUIRE(source.compare(t.pos.offset, t.text.size(), t.text) == 0);
        out += t.text;
        at = t.pos.offset + t.text.size();
    }
    out += source.substr(at);
    return out;
}

// ===== Basic tokenization =====

TEST_CASE("lex empty string", "[lexer]") {
    auto r = lex("");
    REQUIRE(r.state == LexState::Done);
    REQUIRE(r.tokens.size() == 1);
    REQUIRE(r.tokens[0].kind == TokenKind::EndOfFile);
    REQUIRE(r.tokens[0].pos.line == 1);
    REQUIRE(r.tokens[0].pos.col == 1);
}

TEST_CASE("lex declaration", "[lexer]") {
    auto r = lex("unsigned long n = 42;");
    REQUIRE(kinds(r) == std::vector<TokenKind>{
        TokenKind::Keyword, TokenKind::Keyword, TokenKind::Identifier,
        TokenKind::Punctuator, TokenKind::IntegerConstant,
        TokenKind::Punctuator, TokenKind::EndOfFile});
    REQUIRE(r.tokens[4].integer()->value == 42);
    REQUIRE_FALSE(r.has_errors());
}

TEST_CASE("keyword vs identifier", "[lexer]") {
    auto r = lex("int integer _int2");
    REQUIRE(r.tokens[0].kind == TokenKind::Keyword);
    REQUIRE(r.tokens[1].kind == TokenKind::Identifier);
    REQUIRE(r.tokens[2].kind == TokenKind::Identifier);
}

TEST_CASE("all 32 keywords lex as Keyword", "[lexer]") {
    std::string src;
    for (auto& kw : c89_keywords()) src += kw + " ";
    auto r = lex(src);
    REQUIRE(r.tokens.size() == 33);
    for (size_t i = 0; i < 32; ++i) {
        REQUIRE(r.tokens[i].kind == TokenKind::Keyword);
    }
}

TEST_CASE("longest match on <<=", "[lexer]") {
    auto r = lex("<<=");
    REQUIRE(r.tokens.size() == 2);
    REQUIRE(r.tokens[0].is_punct("<<="));
}

TEST_CASE("operator soup splits greedily", "[lexer]") {
    auto r = lex("a+++++b x->y...z");
    std::vector<std::string> texts;
    for (auto& t : r.tokens) texts.push_back(t.text);
    REQUIRE(texts == std::vector<std::string>{
        "a", "++", "++", "+", "b", "x", "->", "y", "...", "z", ""});
}

TEST_CASE("member access vs floating constant", "[lexer]") {
    auto r = lex("s.x .5 s..y");
    REQUIRE(r.tokens[1].is_punct("."));
    REQUIRE(r.tokens[3].kind == TokenKind::FloatingConstant);
    REQUIRE(r.tokens[5].is_punct("."));
    REQUIRE(r.tokens[6].is_punct("."));
}

TEST_CASE("numeric boundary cases", "[lexer]") {
    auto r = lex("0x1AuL 3.14e10f");
    REQUIRE(r.tokens[0].kind == TokenKind::IntegerConstant);
    auto* iv = r.tokens[0].integer();
    REQUIRE(iv->value == 26);
    REQUIRE(iv->base == IntegerBase::Hex);
    REQUIRE(iv->is_unsigned);
    REQUIRE(iv->is_long);
    REQUIRE(r.tokens[1].kind == TokenKind::FloatingConstant);
    REQUIRE(r.tokens[1].floating()->suffix == FloatSuffix::Float);
}

TEST_CASE("08 is flagged as an invalid numeric constant", "[lexer]") {
    auto r = lex("x = 08;");
    REQUIRE(r.tokens[2].kind == TokenKind::Error);
    REQUIRE(r.tokens[2].text == "08");
    REQUIRE(r.tokens[2].error == DiagnosticKind::InvalidNumericConstant);
    REQUIRE(r.tokens[3].is_punct(";"));
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].kind == DiagnosticKind::InvalidNumericConstant);
    REQUIRE(r.diagnostics[0].lexeme == "08");
    REQUIRE(r.diagnostics[0].pos.col == 5);
    REQUIRE(r.state == LexState::Done);
}

TEST_CASE("character and string literals carry decoded values", "[lexer]") {
    auto r = lex("'\\n' \"hi\\t\"");
    REQUIRE(r.tokens[0].kind == TokenKind::CharacterConstant);
    REQUIRE(r.tokens[0].literal()->char_value() == '\n');
    REQUIRE(r.tokens[1].kind == TokenKind::StringLiteral);
    REQUIRE(r.tokens[1].literal()->bytes == "hi\t");
}

// ===== Error recovery =====

TEST_CASE("unterminated string still ends with EndOfFile", "[lexer]") {
    auto r = lex("\"abc");
    REQUIRE(r.state == LexState::Done);
    REQUIRE_FALSE(r.fatal());
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].kind == DiagnosticKind::UnterminatedStringLiteral);
    REQUIRE(r.diagnostics[0].severity == Severity::Error);
    REQUIRE(r.tokens.size() == 2);
    REQUIRE(r.tokens[0].text == "\"abc");
    REQUIRE(r.tokens.back().kind == TokenKind::EndOfFile);
    REQUIRE(r.status().is_ok());
}

TEST_CASE("unterminated string resumes on the next line", "[lexer]") {
    auto r = lex("s = \"abc;\nint y;");
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.tokens[2].kind == TokenKind::Error);
    REQUIRE(r.tokens[2].text == "\"abc;");
    REQUIRE(r.tokens[3].is_keyword("int"));
    REQUIRE(r.tokens[3].pos.line == 2);
}

TEST_CASE("unknown characters are skipped one at a time", "[lexer]") {
    auto r = lex("a @$ b");
    REQUIRE(r.diagnostics.size() == 2);
    REQUIRE(r.diagnostics[0].kind == DiagnosticKind::UnknownCharacter);
    REQUIRE(r.diagnostics[0].lexeme == "@");
    REQUIRE(r.diagnostics[1].lexeme == "$");
    REQUIRE(r.tokens[3].text == "b");
    REQUIRE(r.tokens.back().kind == TokenKind::EndOfFile);
}

TEST_CASE("non-ASCII byte outside literals is an unknown character", "[lexer]") {
    auto r = lex("x \xE9 y \"\xE9\"");
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].kind == DiagnosticKind::UnknownCharacter);
    REQUIRE(r.tokens[3].kind == TokenKind::StringLiteral);
}

TEST_CASE("empty character constant is recoverable", "[lexer]") {
    auto r = lex("c = '';");
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].kind == DiagnosticKind::EmptyCharacterConstant);
    REQUIRE(r.tokens[3].is_punct(";"));
}

TEST_CASE("errors fixture reports every problem and keeps going", "[lexer]") {
    auto src = read_file(fixture_dir() + "/errors.c");
    auto r = lex(src, "errors.c");
    REQUIRE(r.state == LexState::Done);

    std::vector<DiagnosticKind> got;
    for (auto& d : r.diagnostics) got.push_back(d.kind);
    REQUIRE(got == std::vector<DiagnosticKind>{
        DiagnosticKind::InvalidNumericConstant,
        DiagnosticKind::EmptyCharacterConstant,
        DiagnosticKind::UnterminatedStringLiteral,
        DiagnosticKind::UnknownCharacter,
        DiagnosticKind::InvalidNumericConstant,
        DiagnosticKind::InvalidEscapeSequence,
    });
    REQUIRE(r.diagnostics[0].pos.line == 2);
    REQUIRE(r.diagnostics[3].pos.line == 5);

    // The last line is lexed normally
    auto& toks = r.tokens;
    REQUIRE(toks[toks.size() - 2].is_punct(";"));
    REQUIRE(toks[toks.size() - 3].integer()->value == 2);
    REQUIRE(toks[toks.size() - 3].pos.line == 7);
}

// ===== Comments =====

TEST_CASE("comments are stripped", "[lexer]") {
    auto r = lex("/* a */int/* b */ x;");
    REQUIRE(r.tokens.size() == 4);
    REQUIRE(r.tokens[0].is_keyword("int"));
    REQUIRE(r.tokens[1].kind == TokenKind::Identifier);
    REQUIRE(r.tokens[1].text == "x");
    REQUIRE(r.tokens[2].is_punct(";"));
    REQUIRE(r.tokens[3].kind == TokenKind::EndOfFile);
}

TEST_CASE("comments are kept as tokens on request", "[lexer]") {
    LexOptions opts;
    opts.keep_comments = true;
    auto r = lex("/* a */int", "<input>", opts);
    REQUIRE(r.tokens.size() == 3);
    REQUIRE(r.tokens[0].kind == TokenKind::Comment);
    REQUIRE(r.tokens[0].text == "/* a */");
    REQUIRE(r.tokens[1].is_keyword("int"));
}

TEST_CASE("line comments depend on the dialect", "[lexer]") {
    auto strict = lex("a // b\nc");
    REQUIRE(strict.tokens[1].is_punct("/"));
    REQUIRE(strict.tokens[2].is_punct("/"));
    REQUIRE(strict.tokens[3].text == "b");

    LexOptions opts;
    opts.allow_line_comments = true;
    auto ext = lex("a // b\nc", "<input>", opts);
    REQUIRE(ext.tokens.size() == 3);
    REQUIRE(ext.tokens[1].text == "c");
    REQUIRE(ext.tokens[1].pos.line == 2);
}

TEST_CASE("unterminated block comment is fatal", "[lexer]") {
    auto r = lex("int x; /* never closed");
    REQUIRE(r.state == LexState::Fatal);
    REQUIRE(r.fatal());
    REQUIRE(r.tokens.size() == 3);
    REQUIRE(r.tokens[2].is_punct(";"));
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].kind == DiagnosticKind::UnterminatedComment);
    REQUIRE(r.diagnostics[0].is_fatal());
    REQUIRE(r.diagnostics[0].pos.col == 8);

    auto s = r.status();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == ClexError::Lex);
    REQUIRE(s.error().line == 1);
    REQUIRE(s.error().col == 8);
}

TEST_CASE("unterminated comment alone yields no tokens", "[lexer]") {
    auto r = lex("/* never closed");
    REQUIRE(r.fatal());
    REQUIRE(r.tokens.empty());
    REQUIRE(r.diagnostics.size() == 1);
}

TEST_CASE("unterminated comment fixture", "[lexer]") {
    auto src = read_file(fixture_dir() + "/unterminated.c");
    auto r = lex(src, "unterminated.c");
    REQUIRE(r.fatal());
    REQUIRE(r.tokens.size() == 3);
    REQUIRE(r.fatal_diagnostic() != nullptr);
    REQUIRE(r.fatal_diagnostic()->pos.line == 2);
}

TEST_CASE("EndOfFile follows trailing whitespace and comments", "[lexer]") {
    auto r = lex("x  /* tail */ \n\n");
    REQUIRE(r.tokens.size() == 2);
    REQUIRE(r.tokens[1].kind == TokenKind::EndOfFile);
    REQUIRE(r.tokens[1].pos.line == 3);
}

// ===== Preprocessor directives =====

TEST_CASE("directive at line start is one token", "[lexer]") {
    auto r = lex("#include <stdio.h>\nint x;");
    REQUIRE(r.tokens[0].kind == TokenKind::PreprocessorDirective);
    REQUIRE(r.tokens[0].text == "#include <stdio.h>");
    REQUIRE(r.tokens[1].is_keyword("int"));
    REQUIRE(r.tokens[1].pos.line == 2);
}

TEST_CASE("indented directive with continuation", "[lexer]") {
    auto r = lex("  #define MAX(a, b) \\\n    ((a) > (b))\nMAX(1, 2)");
    REQUIRE(r.tokens[0].kind == TokenKind::PreprocessorDirective);
    REQUIRE(r.tokens[0].text == "#define MAX(a, b) \\\n    ((a) > (b))");
    REQUIRE(r.tokens[0].pos.col == 3);
    REQUIRE(r.tokens[1].text == "MAX");
    REQUIRE(r.tokens[1].pos.line == 3);
}

TEST_CASE("hash in the middle of a line is a punctuator", "[lexer]") {
    auto r = lex("x # y ## z");
    REQUIRE(r.tokens[1].is_punct("#"));
    REQUIRE(r.tokens[3].is_punct("##"));
    REQUIRE_FALSE(r.has_errors());
}

TEST_CASE("directive after a comment on the same line is not a directive", "[lexer]") {
    auto r = lex("/* c */ #x\n#y");
    REQUIRE(r.tokens[0].is_punct("#"));
    REQUIRE(r.tokens[2].kind == TokenKind::PreprocessorDirective);
    REQUIRE(r.tokens[2].text == "#y");
}

TEST_CASE("spliced identifier is one token", "[lexer]") {
    std::string src = "x\\\ny = 1;";
    auto r = lex(src);
    REQUIRE(r.tokens[0].kind == TokenKind::Identifier);
    REQUIRE(r.tokens[0].text == "x\\\ny");
    REQUIRE(r.tokens[1].is_punct("="));
    REQUIRE(r.tokens[1].pos.line == 2);
    REQUIRE(reconstruct(r, src) == src);
}

// ===== Lazy producer =====

TEST_CASE("Lexer yields tokens one at a time", "[lexer]") {
    std::string src = "a = 1;";
    Lexer lexer(src, "lazy.c");
    REQUIRE(lexer.state() == LexState::Scanning);

    auto t = lexer.next();
    REQUIRE(t);
    REQUIRE(t->text == "a");
    REQUIRE(t->pos.file == "lazy.c");

    int count = 1;
    while (auto tok = lexer.next()) {
        ++count;
        if (tok->kind == TokenKind::EndOfFile) break;
    }
    REQUIRE(count == 5);
    REQUIRE(lexer.state() == LexState::Done);
    REQUIRE_FALSE(lexer.next());
}

TEST_CASE("Lexer only borrows named buffers", "[lexer]") {
    STATIC_REQUIRE(std::is_constructible<Lexer, const std::string&>::value);
    STATIC_REQUIRE_FALSE(std::is_constructible<Lexer, std::string&&>::value);
    STATIC_REQUIRE_FALSE(std::is_constructible<Lexer, const char*>::value);
    STATIC_REQUIRE_FALSE(std::is_constructible<Lexer, std::string, std::string>::value);
}

TEST_CASE("Lexer is back to Scanning after a directive", "[lexer]") {
    std::string src = "#define N 1\nint";
    Lexer lexer(src);
    auto d = lexer.next();
    REQUIRE(d->kind == TokenKind::PreprocessorDirective);
    REQUIRE(lexer.state() == LexState::Scanning);
    REQUIRE(lexer.next()->is_keyword("int"));
}

TEST_CASE("Lexer stops producing after Fatal", "[lexer]") {
    std::string src = "a /*";
    Lexer lexer(src);
    REQUIRE(lexer.next()->text == "a");
    REQUIRE_FALSE(lexer.next());
    REQUIRE(lexer.state() == LexState::Fatal);
    REQUIRE(lexer.diagnostics().size() == 1);
    REQUIRE_FALSE(lexer.next());
}

// ===== Properties =====

TEST_CASE("positions strictly increase", "[lexer]") {
    auto src = read_file(fixture_dir() + "/hello.c");
    auto r = lex(src, "hello.c");
    for (size_t i = 1; i < r.tokens.size(); ++i) {
        auto& a = r.tokens[i - 1].pos;
        auto& b = r.tokens[i].pos;
        bool increasing = b.line > a.line || (b.line == a.line && b.col > a.col);
        REQUIRE(increasing);
        REQUIRE(b.offset > a.offset);
    }
}

TEST_CASE("reconstruction is lossless", "[lexer]") {
    for (const char* name : {"hello.c", "errors.c"}) {
        auto src = read_file(fixture_dir() + "/" + name);
        REQUIRE_FALSE(src.empty());
        auto r = lex(src, name);
        REQUIRE(reconstruct(r, src) == src);
    }
}

TEST_CASE("scanning is deterministic", "[lexer]") {
    auto src = read_file(fixture_dir() + "/errors.c");
    auto a = lex(src, "errors.c");
    auto b = lex(src, "errors.c");
    REQUIRE(a.tokens.size() == b.tokens.size());
    for (size_t i = 0; i < a.tokens.size(); ++i) {
        REQUIRE(a.tokens[i].kind == b.tokens[i].kind);
        REQUIRE(a.tokens[i].text == b.tokens[i].text);
        REQUIRE(a.tokens[i].pos.offset == b.tokens[i].pos.offset);
    }
    REQUIRE(a.diagnostics.size() == b.diagnostics.size());
    for (size_t i = 0; i < a.diagnostics.size(); ++i) {
        REQUIRE(a.diagnostics[i].format() == b.diagnostics[i].format());
    }
}

TEST_CASE("exactly one EndOfFile, always last", "[lexer]") {
    auto src = read_file(fixture_dir() + "/hello.c");
    auto r = lex(src, "hello.c");
    size_t eofs = 0;
    for (auto& t : r.tokens) {
        if (t.kind == TokenKind::EndOfFile) ++eofs;
    }
    REQUIRE(eofs == 1);
    REQUIRE(r.tokens.back().kind == TokenKind::EndOfFile);
}

// ===== Fixture files =====

TEST_CASE("lex hello.c fixture", "[lexer]") {
    auto src = read_file(fixture_dir() + "/hello.c");
    auto r = lex(src, "hello.c");
    REQUIRE(r.state == LexState::Done);
    REQUIRE_FALSE(r.has_errors());

    size_t directives = 0;
    bool saw_hex = false;
    bool saw_octal_long = false;
    bool saw_half = false;
    for (auto& t : r.tokens) {
        if (t.kind == TokenKind::PreprocessorDirective) ++directives;
        if (t.text == "0x1FUL") saw_hex = t.integer()->value == 31;
        if (t.text == "0777L") {
            saw_octal_long = t.integer()->value == 511 && t.integer()->is_long;
        }
        if (t.text == ".5f") saw_half = t.kind == TokenKind::FloatingConstant;
    }
    REQUIRE(directives == 3);
    REQUIRE(saw_hex);
    REQUIRE(saw_octal_long);
    REQUIRE(saw_half);
}

TEST_CASE("lex_state_name covers every state", "[lexer]") {
    REQUIRE(std::string(lex_state_name(LexState::Scanning)) == "Scanning");
    REQUIRE(std::string(lex_state_name(LexState::InDirective)) == "InDirective");
    REQUIRE(std::string(lex_state_name(LexState::Done)) == "Done");
    REQUIRE(std::string(lex_state_name(LexState::Fatal)) == "Fatal");
}
