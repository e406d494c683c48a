#pragma once

#include <clex/result.hpp>
#include <string>
#include <vector>

namespace clex {

// An immutable, fully loaded source buffer. The lexer never performs I/O;
// callers load the file once and hand the text over.
class SourceFile {
public:
    static Result<SourceFile> load(const std::string& path);
    static SourceFile from_string(std::string text,
                                  std::string path = "<input>");

    const std::string& path() const { return path_; }
    const std::string& text() const { return text_; }

    // Number of physical lines; a trailing newline does not start a new line
    int line_count() const;

    // Text of a 1-based line without its line terminator, empty if out of range
    std::string line_text(int line) const;

private:
    std::string path_;
    std::string text_;
    std::vector<size_t> line_starts_;

    void index_lines();
};

} // namespace clex
