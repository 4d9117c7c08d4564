#include <gtest/gtest.h>
#include <bridge/event_log.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

class EventLogTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("mcbridge_event_log_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::vector<std::string> read_lines(const fs::path& p) {
        std::vector<std::string> lines;
        std::ifstream in(p);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }
};

TEST_F(EventLogTest, AppendsCompactLineWithTimestamp) {
    EventLogSink sink(test_dir / "radio.adverts.jsonl");
    double before = epoch_seconds();

    auto r = sink.append({{"payload_typename", "ADVERT"}, {"adv_name", "Zoë"}});
    ASSERT_TRUE(r.is_ok());

    auto lines = read_lines(sink.path());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find('\n'), std::string::npos);

    auto j = json::parse(lines[0]);
    EXPECT_EQ(j["adv_name"], "Zoë");
    ASSERT_TRUE(j["ts"].is_number_float());
    EXPECT_GE(j["ts"].get<double>(), before);
    EXPECT_EQ(sink.written(), 1u);
}

TEST_F(EventLogTest, TimestampOverwritesPayloadTs) {
    EventLogSink sink(test_dir / "a.jsonl");
    ASSERT_TRUE(sink.append({{"payload_typename", "ADVERT"}, {"ts", "bogus"}}).is_ok());
    auto j = json::parse(read_lines(sink.path()).at(0));
    EXPECT_TRUE(j["ts"].is_number());
}

TEST_F(EventLogTest, AppendsInOrder) {
    EventLogSink sink(test_dir / "a.jsonl");
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(sink.append({{"payload_typename", "ADVERT"}, {"n", i}}).is_ok());
    }
    auto lines = read_lines(sink.path());
    ASSERT_EQ(lines.size(), 3u);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(json::parse(lines[i])["n"], i);
    }
}

TEST_F(EventLogTest, NonObjectRejected) {
    EventLogSink sink(test_dir / "a.jsonl");
    EXPECT_TRUE(sink.append(json::array({1, 2})).is_err());
    EXPECT_FALSE(fs::exists(sink.path()));
}

TEST_F(EventLogTest, WriteFailureReturnedNotThrown) {
    fs::create_directories(test_dir);
    // A directory where the file should be makes the open fail
    fs::create_directories(test_dir / "blocked.jsonl");
    EventLogSink sink(test_dir / "blocked.jsonl");

    Result<void> r = Result<void>::Ok();
    EXPECT_NO_THROW(r = sink.append({{"payload_typename", "ADVERT"}}));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(sink.failed(), 1u);
    EXPECT_EQ(sink.written(), 0u);
}
