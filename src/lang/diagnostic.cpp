#include <clex/lang/diagnostic.hpp>

namespace clex {

Severity severity_of(DiagnosticKind k) {
    switch (k) {
    case DiagnosticKind::UnterminatedComment:
    case DiagnosticKind::InternalError:
        return Severity::Fatal;
    default:
        return Severity::Error;
    }
}

std::string Diagnostic::format() const {
    std::string result = pos.file;
    result += ":" + std::to_string(pos.line);
    result += ":" + std::to_string(pos.col);
    result += is_fatal() ? ": fatal[" : ": error[";
    result += diagnostic_kind_name(kind);
    result += "]: ";
    result += message;
    return result;
}

std::string Diagnostic::render(const SourceFile& source) const {
    std::string result = format();

    std::string line = source.line_text(pos.line);
    if (line.empty()) return result;

    std::string gutter = std::to_string(pos.line);
    result += "\n " + gutter + " | " + line;
    result += "\n " + std::string(gutter.size(), ' ') + " | ";

    // Keep tabs so the caret lines up with the echoed line
    int col = 1;
    for (char c : line) {
        if (col >= pos.col) break;
        result += (c == '\t') ? '\t' : ' ';
        ++col;
    }

    // Underline the lexeme up to the end of its first line
    size_t width = lexeme.find('\n');
    if (width == std::string::npos) width = lexeme.size();
    size_t room = line.size() >= static_cast<size_t>(pos.col - 1)
                      ? line.size() - static_cast<size_t>(pos.col - 1) : 0;
    if (width > room) width = room;
    result += '^';
    if (width > 1) result += std::string(width - 1, '~');
    return result;
}

} // namespace clex
