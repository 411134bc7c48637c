#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ctxengine {

// A contiguous, whitespace-trimmed span of the source document.
struct Section {
    std::string text;
    size_t start_offset;
    size_t end_offset;  // one past the last byte
    std::optional<std::string> nearest_heading;
};

// Sections longer than this (outside code fences) are split into lines.
constexpr size_t LONG_SECTION_CHARS = 1000;

// Heading title if `line` is a Markdown heading ("## Title") or an
// ALL-CAPS line of at least 11 characters.
std::optional<std::string> parse_heading(const std::string& line);

// Splits on blank lines, heading lines and fenced code blocks. A heading
// line opens the section that follows it; a fenced block is one section.
std::vector<Section> split_into_sections(const std::string& text);

// Last heading whose line starts before `offset`, ignoring fenced code.
std::optional<std::string> nearest_heading(const std::string& text, size_t offset);

// Every heading in document order, plus "Subject:" lines.
std::vector<std::string> extract_document_structure(const std::string& text);

} // namespace ctxengine
