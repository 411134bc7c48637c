#include <gtest/gtest.h>

#include "prompt_formatter.hpp"

using namespace ctxengine;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(FormatContextForPrompt, CursorAtEndOfText) {
    ContextBundle bundle;
    bundle.local_before = "The quick brown fox jumps over the lazy dog";

    std::string prompt = format_context_for_prompt(bundle);
    EXPECT_TRUE(contains(prompt, "CONTEXT BEFORE CURSOR:\nThe quick brown fox"));
    EXPECT_TRUE(contains(prompt, "CONTEXT AFTER CURSOR:\n[End of document]"));
    EXPECT_TRUE(contains(prompt, "CURSOR AT END: Your text will continue after \"...jumps over the lazy dog\""))
        << prompt;
}

TEST(FormatContextForPrompt, CursorAtStartOfText) {
    ContextBundle bundle;
    bundle.local_after = "Opening words of the draft";

    std::string prompt = format_context_for_prompt(bundle);
    EXPECT_TRUE(contains(prompt, "CONTEXT BEFORE CURSOR:\n[Start of document]"));
    EXPECT_TRUE(contains(prompt, "CURSOR AT START: Your text will come before \"Opening words of the draft...\""));
}

TEST(FormatContextForPrompt, HeadingAndRelatedSections) {
    ContextBundle bundle;
    bundle.local_before = "before text";
    bundle.local_after = "after text";
    bundle.nearest_heading = "Methods";
    bundle.related_sections.push_back({"First related.", 0.8f, 0, 14, std::nullopt});
    bundle.related_sections.push_back({"  Second related.  ", 0.4f, 20, 39, std::nullopt});

    std::string prompt = format_context_for_prompt(bundle);
    EXPECT_TRUE(contains(prompt, "Note: The cursor is between existing text."));
    EXPECT_TRUE(contains(prompt, "CURRENT SECTION: Methods"));
    EXPECT_TRUE(contains(prompt, "RELATED SECTIONS FROM DOCUMENT (for context and consistency):\n"
                                 "1. First related.\n\n2. Second related."));
    EXPECT_LT(prompt.find("CONTEXT BEFORE CURSOR"), prompt.find("RELATED SECTIONS"));
}

TEST(FormatContextForPrompt, OptionsOmitBlocks) {
    ContextBundle bundle;
    bundle.local_before = "text";
    bundle.nearest_heading = "Methods";
    bundle.related_sections.push_back({"Related.", 0.5f, 0, 8, std::nullopt});

    FormatOptions options;
    options.include_related = false;
    options.include_heading = false;
    std::string prompt = format_context_for_prompt(bundle, options);
    EXPECT_FALSE(contains(prompt, "RELATED SECTIONS"));
    EXPECT_FALSE(contains(prompt, "CURRENT SECTION"));
}

TEST(FormatContextForPrompt, EmptyBundleFormatsToEmptyString) {
    EXPECT_EQ(format_context_for_prompt(ContextBundle{}), "");
}

TEST(FormatPinnedNotes, NumbersNotes) {
    EXPECT_EQ(format_pinned_notes({}), "");
    EXPECT_EQ(format_pinned_notes({"Be concise", "Use British spelling"}),
              "RELEVANT CONTEXT AND GUIDANCE:\n1. Be concise\n2. Use British spelling\n");
}
