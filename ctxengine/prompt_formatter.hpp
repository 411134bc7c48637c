#pragma once

#include <string>
#include <vector>

#include "context_assembler.hpp"

namespace ctxengine {

struct FormatOptions {
    bool include_related = true;
    bool include_heading = true;
};

// Renders a bundle as delimited plain-text blocks for a generation prompt.
std::string format_context_for_prompt(const ContextBundle& bundle,
                                      const FormatOptions& options = {});

// Numbered "RELEVANT CONTEXT AND GUIDANCE" block; empty for no notes.
std::string format_pinned_notes(const std::vector<std::string>& notes);

} // namespace ctxengine
