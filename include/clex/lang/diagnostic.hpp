#pragma once

#include <clex/lang/token.hpp>
#include <clex/source.hpp>
#include <string>

namespace clex {

enum class Severity {
    Error,  // recoverable, scanning continues
    Fatal   // scanning halted
};

struct Diagnostic {
    DiagnosticKind kind;
    Severity severity;
    std::string lexeme;   // raw source text the diagnostic covers
    std::string message;
    SourcePos pos;

    bool is_fatal() const { return severity == Severity::Fatal; }

    // file:line:col: error[Kind]: message
    std::string format() const;

    // format() followed by the offending source line and a caret marker
    std::string render(const SourceFile& source) const;
};

Severity severity_of(DiagnosticKind k);

} // namespace clex
