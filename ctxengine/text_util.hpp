#pragma once

#include <string>
#include <vector>

namespace ctxengine {

std::string trim(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Nearest offsets <= / >= `pos` that do not fall inside a UTF-8 sequence.
size_t utf8_floor(const std::string& s, size_t pos);
size_t utf8_ceil(const std::string& s, size_t pos);

// Whitespace-separated words at the start / end of `s`, at most `n`.
std::vector<std::string> first_words(const std::string& s, size_t n);
std::vector<std::string> last_words(const std::string& s, size_t n);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace ctxengine
