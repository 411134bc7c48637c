#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ctxengine {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

size_t utf8_floor(const std::string& s, size_t pos) {
    pos = std::min(pos, s.size());
    while (pos > 0 && pos < s.size() && is_continuation(s[pos])) --pos;
    return pos;
}

size_t utf8_ceil(const std::string& s, size_t pos) {
    pos = std::min(pos, s.size());
    while (pos < s.size() && is_continuation(s[pos])) ++pos;
    return pos;
}

std::vector<std::string> first_words(const std::string& s, size_t n) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string word;
    while (words.size() < n && in >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> last_words(const std::string& s, size_t n) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    if (words.size() > n) {
        words.erase(words.begin(), words.end() - static_cast<std::ptrdiff_t>(n));
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace ctxengine
