#include <clex/lang/cursor.hpp>
#include <cstring>

namespace clex {

Cursor::Cursor(const std::string& source) : source_(source) {}

char Cursor::peek(size_t k) const {
    return has(k) ? source_[offset_ + k] : '\0';
}

char Cursor::advance() {
    if (at_end()) return '\0';
    char c = source_[offset_++];
    if (c == '\n') {
        ++line_;
        col_ = 1;
    } else {
        ++col_;
    }
    return c;
}

void Cursor::advance(size_t n) {
    while (n-- > 0 && !at_end()) advance();
}

bool Cursor::starts_with(const char* text) const {
    return source_.compare(offset_, std::strlen(text), text) == 0;
}

bool Cursor::consume(const char* text) {
    if (!starts_with(text)) return false;
    advance(std::strlen(text));
    return true;
}

void Cursor::rewind(const CursorMark& m) {
    offset_ = m.offset;
    line_ = m.line;
    col_ = m.col;
}

std::string Cursor::slice(size_t start) const {
    if (start >= offset_) return "";
    return source_.substr(start, offset_ - start);
}

} // namespace clex
