#include <gtest/gtest.h>

#include "context_assembler.hpp"
#include "json_codec.hpp"

using namespace ctxengine;

namespace {

const std::string kSampleDoc =
    "# Intro\nML is great.\n\n# Details\nSupervised learning uses labels.\n\n"
    "# More\nUnsupervised learning finds patterns. CURSOR_HERE";

const std::string kFillerDoc =
    "# Intro\nML is great.\n\n"
    "# Filler\nThe bakery sells fresh bread every morning.\n\n"
    "# Details\nSupervised learning uses labels.\n\n"
    "# More\nUnsupervised learning finds patterns. CURSOR_HERE";

const std::string kPrefix = "Neural networks learn representations from data in many layers";
const std::string kLast = "neural networks with many layers";

std::string duplicate_doc() {
    return kPrefix + " variant one.\n\n" + kPrefix + " variant two.\n\n"
           "Unrelated bakery bread.\n\n" + kLast;
}

// Local window that covers exactly the final paragraph when the cursor is at the end.
AssembleOptions last_paragraph_window() {
    AssembleOptions options;
    options.local_window = 2 * kLast.size();
    return options;
}

} // namespace

TEST(AssembleContext, EmptyDocument) {
    auto bundle = assemble_context("", 0);
    EXPECT_EQ(bundle.local_before, "");
    EXPECT_EQ(bundle.local_after, "");
    EXPECT_TRUE(bundle.related_sections.empty());
    EXPECT_FALSE(bundle.nearest_heading);
    EXPECT_EQ(bundle.section_count, 0u);
    EXPECT_EQ(bundle.total_chars, 0u);
}

TEST(AssembleContext, CursorPastEndIsClamped) {
    auto bundle = assemble_context("Hello world", 999);
    EXPECT_EQ(bundle.local_before, "Hello world");
    EXPECT_EQ(bundle.local_after, "");
}

TEST(AssembleContext, LocalWindowSplitsEvenly) {
    std::string doc(2000, 'a');
    AssembleOptions options;
    options.local_window = 1000;
    auto bundle = assemble_context(doc, 1000, options);
    EXPECT_EQ(bundle.local_before, std::string(500, 'a'));
    EXPECT_EQ(bundle.local_after, std::string(500, 'a'));
}

TEST(AssembleContext, SelectionWindowsStartAtSelectionEdges) {
    const std::string doc = "0123456789abcdefghij";
    AssembleOptions options;
    options.local_window = 6;

    auto bundle = assemble_context(doc, SelectionRange{5, 10}, options);
    EXPECT_EQ(bundle.local_before, "234");
    EXPECT_EQ(bundle.local_after, "abc");

    auto reversed = assemble_context(doc, SelectionRange{10, 5}, options);
    EXPECT_EQ(reversed.local_before, "234");
    EXPECT_EQ(reversed.local_after, "abc");
}

TEST(AssembleContext, OffsetsNeverSplitUtf8Characters) {
    const std::string doc = "h\xC3\xA9llo w\xC3\xB6rld";  // "héllo wörld"
    auto bundle = assemble_context(doc, 2);  // inside the two bytes of 'é'
    EXPECT_EQ(bundle.local_before, "h");
    EXPECT_EQ(bundle.local_after, doc.substr(1));
}

TEST(AssembleContext, ReportsNearestHeading) {
    auto bundle = assemble_context(kSampleDoc, kSampleDoc.find("CURSOR_HERE"));
    EXPECT_EQ(bundle.nearest_heading, std::optional<std::string>("More"));
}

TEST(AssembleContext, RelatedSectionOutranksFiller) {
    AssembleOptions options;
    options.local_window = 80;
    options.max_related_sections = 1;
    auto bundle = assemble_context(kFillerDoc, kFillerDoc.find("CURSOR_HERE"), options);

    EXPECT_EQ(bundle.nearest_heading, std::optional<std::string>("More"));
    EXPECT_EQ(bundle.section_count, 4u);
    ASSERT_EQ(bundle.related_sections.size(), 1u);
    EXPECT_EQ(bundle.related_sections[0].heading, std::optional<std::string>("Details"));
    EXPECT_EQ(bundle.related_sections[0].text, "# Details\nSupervised learning uses labels.");
    EXPECT_GT(bundle.related_sections[0].score, 0.0f);
}

TEST(AssembleContext, ZeroOverlapSectionsAreNeverIncluded) {
    AssembleOptions options;
    options.local_window = 80;
    auto bundle = assemble_context(kFillerDoc, kFillerDoc.find("CURSOR_HERE"), options);
    for (const auto& s : bundle.related_sections) {
        EXPECT_NE(s.heading, std::optional<std::string>("Filler"));
        EXPECT_NE(s.heading, std::optional<std::string>("Intro"));
    }
}

TEST(AssembleContext, SingleUnrelatedSectionYieldsNothing) {
    const std::string doc = "Alpha beta gamma.\n\nCompletely different words here";
    AssembleOptions options;
    options.local_window = 2 * std::string("Completely different words here").size();
    auto bundle = assemble_context(doc, doc.size(), options);
    EXPECT_EQ(bundle.section_count, 1u);
    EXPECT_TRUE(bundle.related_sections.empty());
}

TEST(AssembleContext, DeduplicatesSharedPrefixes) {
    const std::string doc = duplicate_doc();

    auto bundle = assemble_context(doc, doc.size(), last_paragraph_window());
    EXPECT_EQ(bundle.local_before, kLast);
    EXPECT_EQ(bundle.section_count, 3u);
    ASSERT_EQ(bundle.related_sections.size(), 1u);
    EXPECT_EQ(bundle.related_sections[0].start_offset, 0u);

    auto options = last_paragraph_window();
    options.enable_deduplication = false;
    EXPECT_EQ(assemble_context(doc, doc.size(), options).related_sections.size(), 2u);
}

TEST(AssembleContext, CompressesLongSectionsToMaxLength) {
    const std::string doc = duplicate_doc();
    auto options = last_paragraph_window();
    options.max_section_length = 40;
    options.enable_deduplication = false;

    auto bundle = assemble_context(doc, doc.size(), options);
    ASSERT_FALSE(bundle.related_sections.empty());
    for (const auto& s : bundle.related_sections) {
        EXPECT_LE(s.text.size(), 40u);
        EXPECT_EQ(kPrefix.compare(0, s.text.size(), s.text), 0) << s.text;
    }
    EXPECT_LE(bundle.total_chars,
              options.local_window + options.max_related_sections * options.max_section_length);
}

TEST(AssembleContext, RelevanceScoringCanBeDisabled) {
    const std::string doc = duplicate_doc();
    auto options = last_paragraph_window();
    options.enable_relevance_scoring = false;

    auto bundle = assemble_context(doc, doc.size(), options);
    EXPECT_EQ(bundle.local_before, kLast);
    EXPECT_TRUE(bundle.related_sections.empty());
    EXPECT_EQ(bundle.section_count, 0u);
}

TEST(AssembleContext, RepeatedCallsAreIdentical) {
    AssembleOptions options;
    options.local_window = 80;
    size_t cursor = kFillerDoc.find("CURSOR_HERE");

    nlohmann::json first = assemble_context(kFillerDoc, cursor, options);
    nlohmann::json second = assemble_context(kFillerDoc, cursor, options);
    EXPECT_EQ(first.dump(), second.dump());
}

TEST(CompressSection, ShortTextIsUnchanged) {
    EXPECT_EQ(compress_section("Short text.", 250), "Short text.");
}

TEST(CompressSection, KeepsLeadingSentencesThatFit) {
    const std::string text = "First sentence here. Second sentence is here. Third one.";
    EXPECT_EQ(compress_section(text, 30), "First sentence here.");
    EXPECT_EQ(compress_section(text, 50), "First sentence here. Second sentence is here.");
}

TEST(CompressSection, CutsAtWordBoundaryWhenNoSentenceFits) {
    EXPECT_EQ(compress_section("one two three four five six seven eight nine", 20),
              "one two three four");
    EXPECT_LE(compress_section("Averyveryverylongwordwithoutanyspaces and more", 20).size(), 20u);
}
