#include <clex/source.hpp>
#include <fstream>
#include <sstream>

namespace clex {

Result<SourceFile> SourceFile::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ClexError{ClexError::IO,
            "cannot open source file: " + path,
            "check that the path exists and is readable"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return ClexError{ClexError::IO, "error while reading: " + path};
    }
    return Result<SourceFile>::ok(from_string(ss.str(), path));
}

SourceFile SourceFile::from_string(std::string text, std::string path) {
    SourceFile sf;
    sf.path_ = std::move(path);
    sf.text_ = std::move(text);
    sf.index_lines();
    return sf;
}

void SourceFile::index_lines() {
    line_starts_.clear();
    line_starts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n' && i + 1 < text_.size()) {
            line_starts_.push_back(i + 1);
        }
    }
}

int SourceFile::line_count() const {
    if (text_.empty()) return 0;
    return static_cast<int>(line_starts_.size());
}

std::string SourceFile::line_text(int line) const {
    if (line < 1 || line > line_count()) return "";
    size_t start = line_starts_[static_cast<size_t>(line - 1)];
    size_t end = text_.find('\n', start);
    if (end == std::string::npos) end = text_.size();
    if (end > start && text_[end - 1] == '\r') --end;
    return text_.substr(start, end - start);
}

} // namespace clex
