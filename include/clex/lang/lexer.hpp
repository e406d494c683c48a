#pragma once

#include <clex/lang/cursor.hpp>
#include <clex/lang/diagnostic.hpp>
#include <clex/lang/matcher.hpp>
#include <clex/lang/token.hpp>
#include <clex/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace clex {

enum class LexState {
    Scanning,
    InDirective,  // only while a directive line is consumed inside next()
    Done,   // EndOfFile emitted
    Fatal   // halted on an unterminated comment or internal error
};

const char* lex_state_name(LexState s);

struct LexResult {
    std::vector<Token> tokens;
    std::vector<Diagnostic> diagnostics;
    LexState state = LexState::Done;

    bool fatal() const { return state == LexState::Fatal; }
    bool has_errors() const { return !diagnostics.empty(); }

    const Diagnostic* fatal_diagnostic() const;

    // Ok unless the scan ended in Fatal; recoverable diagnostics do not fail it
    Status status() const;
};

// Lazy token producer over one source buffer. The buffer must outlive
// the lexer, so temporaries are rejected at compile time. Each call to
// next() yields one token; after EndOfFile (or once the lexer turns
// Fatal) it yields nullopt.
class Lexer {
public:
    Lexer(const std::string& source, std::string filename = "<input>",
          LexOptions options = {});
    Lexer(std::string&&, std::string = "<input>", LexOptions = {}) = delete;

    std::optional<Token> next();

    LexState state() const { return state_; }
    const LexOptions& options() const { return options_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    std::vector<Diagnostic> take_diagnostics() { return std::move(diagnostics_); }

private:
    Cursor cursor_;
    std::string filename_;
    LexOptions options_;
    LexState state_ = LexState::Scanning;
    bool at_line_start_ = true;
    std::vector<Diagnostic> diagnostics_;

    std::optional<Token> emit(Match m, const SourcePos& start);
    void report(DiagnosticKind kind, std::string message,
                std::string lexeme, const SourcePos& pos);
    void halt(DiagnosticKind kind, std::string message, const SourcePos& pos);
};

// Scan the whole buffer. Never fails: lexical problems are returned as
// diagnostics and a Fatal state.
LexResult lex(const std::string& source,
              const std::string& filename = "<input>",
              LexOptions options = {});

} // namespace clex
