#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ctxengine {

struct AssembleOptions {
    size_t local_window = 1500;        // chars around the cursor, split evenly before/after
    size_t max_related_sections = 3;
    size_t max_section_length = 250;   // longer related sections are compressed
    bool enable_relevance_scoring = true;  // false: local window only
    bool enable_deduplication = true;
    size_t fingerprint_length = 60;    // prefix compared by deduplication
};

// Half-open byte range [start, end). A cursor is an empty range.
struct SelectionRange {
    size_t start;
    size_t end;
};

struct RelatedSection {
    std::string text;
    float score;
    size_t start_offset;
    size_t end_offset;
    std::optional<std::string> heading;
};

struct ContextBundle {
    std::string local_before;
    std::string local_after;
    std::vector<RelatedSection> related_sections;  // best first
    std::optional<std::string> nearest_heading;
    size_t section_count = 0;  // candidate sections that were scored
    size_t total_chars = 0;
};

// Builds the context for a generation step around a cursor or selection.
// Offsets are byte offsets into the UTF-8 document and are clamped to it.
// Each call trains its own vocabulary, so the result depends only on the
// arguments.
ContextBundle assemble_context(const std::string& document,
                               size_t cursor_offset,
                               const AssembleOptions& options = {});

ContextBundle assemble_context(const std::string& document,
                               SelectionRange selection,
                               const AssembleOptions& options = {});

// Leading sentences of `text` that fit in `max_length`; hard cut at a word
// boundary when even the first sentence is too long.
std::string compress_section(const std::string& text, size_t max_length);

} // namespace ctxengine
