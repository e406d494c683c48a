#pragma once

#include <string>

namespace clex {

struct ClexError {
    enum Code {
        IO,          // input file missing or unreadable
        InvalidArg,  // bad command-line usage
        Lex,         // scan ended in the Fatal state
        Internal
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int col = 0;

    ClexError() = default;
    ClexError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ClexError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ClexError(Code c, std::string msg, std::string h, std::string f,
              int l, int cl = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), col(cl) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Process exit status the CLI reports for this error
    int exit_code() const;
};

} // namespace clex
