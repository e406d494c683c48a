#include <clex/lang/lexer.hpp>
#include <clex/log.hpp>

namespace clex {

const char* lex_state_name(LexState s) {
    switch (s) {
    case LexState::Scanning:    return "Scanning";
    case LexState::InDirective: return "InDirective";
    case LexState::Done:        return "Done";
    case LexState::Fatal:       return "Fatal";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// LexResult
// ---------------------------------------------------------------------------

const Diagnostic* LexResult::fatal_diagnostic() const {
    for (const auto& d : diagnostics) {
        if (d.is_fatal()) return &d;
    }
    return nullptr;
}

Status LexResult::status() const {
    if (!fatal()) return ok_status();

    const Diagnostic* d = fatal_diagnostic();
    if (!d) {
        return ClexError{ClexError::Internal, "lexer halted without a diagnostic"};
    }
    std::string hint;
    if (d->kind == DiagnosticKind::UnterminatedComment) {
        hint = "the comment starting here is never closed with '*/'";
    }
    return ClexError{ClexError::Lex, d->message, hint,
                     d->pos.file, d->pos.line, d->pos.col};
}

// ---------------------------------------------------------------------------
// Lexer driver
// ---------------------------------------------------------------------------

Lexer::Lexer(const std::string& source, std::string filename, LexOptions options)
    : cursor_(source), filename_(std::move(filename)), options_(options) {}

void Lexer::report(DiagnosticKind kind, std::string message,
                   std::string lexeme, const SourcePos& pos) {
    diagnostics_.push_back({kind, severity_of(kind), std::move(lexeme),
                            std::move(message), pos});
}

void Lexer::halt(DiagnosticKind kind, std::string message, const SourcePos& pos) {
    report(kind, std::move(message), cursor_.slice(pos.offset), pos);
    state_ = LexState::Fatal;
    log::debug("%s:%d:%d: lexer halted (%s)", pos.file.c_str(), pos.line,
               pos.col, diagnostic_kind_name(kind));
}

std::optional<Token> Lexer::emit(Match m, const SourcePos& start) {
    if (cursor_.offset() <= start.offset) {
        halt(DiagnosticKind::InternalError, "scanner made no progress", start);
        return std::nullopt;
    }

    Token tok{m.kind, cursor_.slice(start.offset), start, std::move(m.value), m.error};
    if (m.error) {
        report(*m.error, std::move(m.message), tok.text, start);
    }
    return tok;
}

std::optional<Token> Lexer::next() {
    if (state_ == LexState::Done || state_ == LexState::Fatal) {
        return std::nullopt;
    }

    // Whitespace and comments
    for (;;) {
        if (skip_whitespace(cursor_)) at_line_start_ = true;

        auto start = cursor_.pos(filename_);
        auto comment = match_comment(cursor_, options_);
        if (!comment) break;

        if (comment->error) {
            halt(*comment->error, std::move(comment->message), start);
            return std::nullopt;
        }
        at_line_start_ = false;
        if (options_.keep_comments) {
            return emit(std::move(*comment), start);
        }
    }

    auto start = cursor_.pos(filename_);
    if (cursor_.at_end()) {
        state_ = LexState::Done;
        return Token{TokenKind::EndOfFile, "", start, {}, std::nullopt};
    }

    if (at_line_start_ && cursor_.peek() == '#') {
        // Directive lines are consumed whole; the state never outlives this call
        state_ = LexState::InDirective;
        auto directive = match_directive(cursor_, options_);
        state_ = LexState::Scanning;
        at_line_start_ = false;
        if (directive) return emit(std::move(*directive), start);
    }
    at_line_start_ = false;

    for (const auto& rule : token_rules()) {
        auto m = rule.fn(cursor_, options_);
        if (m) return emit(std::move(*m), start);
    }
    return emit(match_unknown(cursor_), start);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

LexResult lex(const std::string& source, const std::string& filename,
              LexOptions options) {
    Lexer lexer(source, filename, options);
    LexResult result;
    while (auto tok = lexer.next()) {
        result.tokens.push_back(std::move(*tok));
    }
    result.state = lexer.state();
    result.diagnostics = lexer.take_diagnostics();

    if (log::enabled(log::Debug)) {
        log::debug("lexed %s: %zu tokens, %zu diagnostics, state %s",
                   filename.c_str(), result.tokens.size(),
                   result.diagnostics.size(), lex_state_name(result.state));
    }
    return result;
}

} // namespace clex
