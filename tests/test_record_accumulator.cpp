#include <gtest/gtest.h>
#include <bridge/record_accumulator.hpp>

class RecordAccumulatorTest : public ::testing::Test {
protected:
    RecordAccumulator acc{EventClassifier({"ADVERT"})};

    std::vector<ClassifiedRecord> feed_all(const std::vector<std::string>& lines) {
        std::vector<ClassifiedRecord> out;
        for (const auto& l : lines) {
            for (auto& r : acc.feed(l)) out.push_back(std::move(r));
        }
        return out;
    }
};

TEST(EventClassifier, RecognizesConfiguredType) {
    EventClassifier c({"ADVERT"});
    auto ev = c.as_event(R"({"payload_typename": "ADVERT", "from_id": "ab12"})");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ((*ev)["from_id"], "ab12");
}

TEST(EventClassifier, OtherTypesAreNotEvents) {
    EventClassifier c({"ADVERT"});
    EXPECT_FALSE(c.as_event(R"({"payload_typename": "TXT_MSG"})").has_value());
    EXPECT_FALSE(c.as_event(R"({"type": "ADVERT"})").has_value());
    EXPECT_FALSE(c.as_event(R"(["ADVERT"])").has_value());
    EXPECT_FALSE(c.as_event("{not json").has_value());
}

TEST_F(RecordAccumulatorTest, PlainLineIsResponse) {
    auto out = acc.feed("Battery: 4.1V");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_EQ(out[0].lines, std::vector<std::string>{"Battery: 4.1V"});
}

TEST_F(RecordAccumulatorTest, BlankLineOutsideRecordDropped) {
    EXPECT_TRUE(acc.feed("").empty());
    EXPECT_TRUE(acc.feed("   ").empty());
}

TEST_F(RecordAccumulatorTest, SingleLineEvent) {
    auto out = acc.feed(R"({"payload_typename":"ADVERT","adv_name":"node1"})");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].is_event());
    EXPECT_EQ(out[0].payload["adv_name"], "node1");
}

TEST_F(RecordAccumulatorTest, FiveLineSplitEventIsOneEvent) {
    auto out = feed_all({
        "{",
        "  \"payload_typename\": \"ADVERT\",",
        "  \"adv_name\": \"node {1}\",",
        "  \"lat\": 52.1",
        "}",
    });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].is_event());
    EXPECT_EQ(out[0].lines.size(), 5u);
    EXPECT_EQ(out[0].payload["adv_name"], "node {1}");
    EXPECT_FALSE(acc.open());
}

TEST_F(RecordAccumulatorTest, RecordStaysOpenUntilBalanced) {
    EXPECT_TRUE(acc.feed("{").empty());
    EXPECT_TRUE(acc.open());
    EXPECT_TRUE(acc.feed("  \"a\": \"}\",").empty());   // brace inside a string
    EXPECT_TRUE(acc.open());
    auto out = acc.feed("}");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_EQ(out[0].lines.size(), 3u);
}

TEST_F(RecordAccumulatorTest, NonEventJsonIsResponseContent) {
    auto out = feed_all({"[", "  {\"name\": \"alice\"},", "  {\"name\": \"bob\"}", "]"});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_EQ(out[0].lines.size(), 4u);
}

TEST_F(RecordAccumulatorTest, UnbalancedCloseReleasedAsResponse) {
    auto out = acc.feed("{}}");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_FALSE(acc.open());
}

TEST_F(RecordAccumulatorTest, FlushReleasesPartialRecord) {
    acc.feed("{");
    acc.feed("  \"payload_typename\": \"ADVERT\",");
    auto out = acc.flush();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_EQ(out[0].lines.size(), 2u);
    EXPECT_FALSE(acc.open());
    EXPECT_TRUE(acc.flush().empty());
}

TEST(RecordAccumulator, LineLimitReleasesCandidate) {
    RecordAccumulator small(EventClassifier({"ADVERT"}), 3, 1024);
    EXPECT_TRUE(small.feed("{").empty());
    EXPECT_TRUE(small.feed("\"a\": 1,").empty());
    auto out = small.feed("\"b\": 2,");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_EQ(out[0].lines.size(), 3u);
    EXPECT_FALSE(small.open());
}

TEST_F(RecordAccumulatorTest, EventBetweenResponses) {
    auto out = feed_all({
        "before",
        R"({"payload_typename":"ADVERT"})",
        "after",
    });
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FALSE(out[0].is_event());
    EXPECT_TRUE(out[1].is_event());
    EXPECT_FALSE(out[2].is_event());
}
