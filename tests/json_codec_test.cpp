#include <gtest/gtest.h>

#include "errors.hpp"
#include "json_codec.hpp"

using namespace ctxengine;
using nlohmann::json;

TEST(JsonCodec, MemoryItemSnapshotKeepsFields) {
    MemoryItem item;
    item.id = "m1";
    item.text = "pinned note";
    item.vector = {0.6f, 0.8f};
    item.metadata = {{"source", "pinned"}, {"tags", {"style"}}};
    item.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    json j = item;
    EXPECT_EQ(j["created_at"], 1700000000123);

    auto restored = j.get<MemoryItem>();
    EXPECT_EQ(restored.id, "m1");
    EXPECT_EQ(restored.text, "pinned note");
    EXPECT_EQ(restored.vector, item.vector);
    EXPECT_EQ(restored.metadata, item.metadata);
    EXPECT_EQ(restored.created_at, item.created_at);
}

TEST(JsonCodec, MemoryItemRequiresIdAndText) {
    EXPECT_THROW(json({{"text", "no id"}}).get<MemoryItem>(), InvalidRequest);
    EXPECT_THROW(json({{"id", "x"}, {"text", 5}}).get<MemoryItem>(), InvalidRequest);
    EXPECT_THROW(json::array().get<MemoryItem>(), InvalidRequest);

    auto minimal = json({{"id", "x"}, {"text", "t"}, {"metadata", nullptr}}).get<MemoryItem>();
    EXPECT_TRUE(minimal.vector.empty());
    EXPECT_TRUE(minimal.metadata.is_object());
}

TEST(JsonCodec, SearchOptionsPartialOverride) {
    auto options = json({{"top_k", 2}, {"enable_jaccard_filter", false}}).get<SearchOptions>();
    EXPECT_EQ(options.top_k, 2u);
    EXPECT_FALSE(options.enable_jaccard_filter);
    EXPECT_FLOAT_EQ(options.max_jaccard_score, 0.8f);
    EXPECT_FLOAT_EQ(options.min_semantic_score, 0.0f);

    EXPECT_EQ(json(nullptr).get<SearchOptions>().top_k, 10u);
}

TEST(JsonCodec, OptionsRejectWrongTypes) {
    EXPECT_THROW(json({{"top_k", -1}}).get<SearchOptions>(), InvalidRequest);
    EXPECT_THROW(json({{"top_k", "3"}}).get<SearchOptions>(), InvalidRequest);
    EXPECT_THROW(json({{"enable_deduplication", 1}}).get<AssembleOptions>(), InvalidRequest);
    EXPECT_THROW(json("options").get<FormatOptions>(), InvalidRequest);
}

TEST(JsonCodec, CountsAcceptSignedAndUnsignedIntegers) {
    // Literals built in code are signed; parsed text is unsigned.
    json in_process = {{"top_k", 2}, {"local_window", 600}};
    ASSERT_FALSE(in_process["top_k"].is_number_unsigned());
    EXPECT_EQ(in_process.get<SearchOptions>().top_k, 2u);
    EXPECT_EQ(in_process.get<AssembleOptions>().local_window, 600u);

    json parsed = json::parse(R"({"top_k": 2, "local_window": 600})");
    ASSERT_TRUE(parsed["top_k"].is_number_unsigned());
    EXPECT_EQ(parsed.get<SearchOptions>().top_k, 2u);
    EXPECT_EQ(parsed.get<AssembleOptions>().local_window, 600u);

    EXPECT_EQ(count_field(json{{"cursor", 0}}, "cursor", 7), 0u);
    EXPECT_EQ(count_field(json::object(), "cursor", 7), 7u);
    EXPECT_THROW(count_field(json{{"local_window", -600}}, "local_window", 0), InvalidRequest);
    EXPECT_THROW(count_field(json{{"local_window", 2.5}}, "local_window", 0), InvalidRequest);
}

TEST(JsonCodec, AssembleOptionsKeepPreloadedDefaults) {
    AssembleOptions options;
    options.local_window = 400;
    from_json(json({{"max_related_sections", 5}}), options);
    EXPECT_EQ(options.local_window, 400u);
    EXPECT_EQ(options.max_related_sections, 5u);
    EXPECT_EQ(options.max_section_length, 250u);
}

TEST(JsonCodec, BundleHeadingsSerializeAsNull) {
    ContextBundle bundle;
    bundle.local_before = "before";
    bundle.related_sections.push_back({"text", 0.5f, 3, 7, std::nullopt});

    json j = bundle;
    EXPECT_TRUE(j["nearest_heading"].is_null());
    EXPECT_TRUE(j["related_sections"][0]["heading"].is_null());
    EXPECT_EQ(j["related_sections"][0]["end_offset"], 7);

    bundle.nearest_heading = "Intro";
    EXPECT_EQ(json(bundle)["nearest_heading"], "Intro");
}
