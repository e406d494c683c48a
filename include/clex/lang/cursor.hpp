#pragma once

#include <clex/lang/token.hpp>
#include <string>

namespace clex {

// Saved cursor position for bounded backtracking
struct CursorMark {
    size_t offset = 0;
    int line = 1;
    int col = 1;
};

// Read-only walk over a pre-loaded source buffer. Tracks byte offset and
// 1-based line/column; a newline resets the column and bumps the line.
// The buffer must outlive the cursor.
class Cursor {
public:
    explicit Cursor(const std::string& source);
    explicit Cursor(std::string&&) = delete;

    // Character k positions ahead, or '\0' past the end of the buffer
    char peek(size_t k = 0) const;

    bool at_end() const { return offset_ >= source_.size(); }
    bool has(size_t k) const { return offset_ + k < source_.size(); }

    // Consume one character; no-op at end of buffer
    char advance();
    void advance(size_t n);

    // Consume `text` if the buffer continues with it
    bool consume(const char* text);
    bool starts_with(const char* text) const;

    CursorMark mark() const { return {offset_, line_, col_}; }
    void rewind(const CursorMark& m);

    size_t offset() const { return offset_; }
    int line() const { return line_; }
    int col() const { return col_; }

    // Source text from `start` up to the current offset
    std::string slice(size_t start) const;

    SourcePos pos(const std::string& file) const {
        return {file, line_, col_, offset_};
    }

    const std::string& source() const { return source_; }

private:
    const std::string& source_;
    size_t offset_ = 0;
    int line_ = 1;
    int col_ = 1;
};

} // namespace clex
