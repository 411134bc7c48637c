#include "prompt_formatter.hpp"

#include "text_util.hpp"

namespace ctxengine {

namespace {

constexpr size_t CURSOR_HINT_WORDS = 5;

} // namespace

std::string format_context_for_prompt(const ContextBundle& bundle,
                                      const FormatOptions& options) {
    std::string out;

    if (!trim(bundle.local_before).empty() || !trim(bundle.local_after).empty()) {
        out += "CONTEXT BEFORE CURSOR:\n";
        out += bundle.local_before.empty() ? "[Start of document]" : bundle.local_before;
        out += "\n\n";
        out += "CONTEXT AFTER CURSOR:\n";
        out += bundle.local_after.empty() ? "[End of document]" : bundle.local_after;
        out += "\n\n";

        auto before = last_words(bundle.local_before, CURSOR_HINT_WORDS);
        auto after = first_words(bundle.local_after, CURSOR_HINT_WORDS);
        if (!before.empty() && !after.empty()) {
            out += "Note: The cursor is between existing text. "
                   "Generate text that continues naturally from the context above.\n\n";
        } else if (!before.empty()) {
            out += "CURSOR AT END: Your text will continue after \"..." + join(before, " ") + "\"\n\n";
        } else if (!after.empty()) {
            out += "CURSOR AT START: Your text will come before \"" + join(after, " ") + "...\"\n\n";
        }
    }

    if (options.include_heading && bundle.nearest_heading) {
        out += "CURRENT SECTION: " + *bundle.nearest_heading + "\n\n";
    }

    if (options.include_related && !bundle.related_sections.empty()) {
        out += "RELATED SECTIONS FROM DOCUMENT (for context and consistency):\n";
        for (size_t i = 0; i < bundle.related_sections.size(); ++i) {
            out += std::to_string(i + 1) + ". " + trim(bundle.related_sections[i].text) + "\n\n";
        }
    }

    return trim(out);
}

std::string format_pinned_notes(const std::vector<std::string>& notes) {
    if (notes.empty()) {
        return "";
    }

    std::string out = "RELEVANT CONTEXT AND GUIDANCE:\n";
    for (size_t i = 0; i < notes.size(); ++i) {
        out += std::to_string(i + 1) + ". " + notes[i] + "\n";
    }
    return out;
}

} // namespace ctxengine
