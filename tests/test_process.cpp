#include <gtest/gtest.h>
#include <platform/line_reader.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <signal.h>

using platform::LineReader;

static std::vector<std::string> read_until(LineReader& reader, size_t count, int timeout_ms = 2000) {
    std::vector<std::string> lines;
    int waited = 0;
    while (lines.size() < count && waited < timeout_ms) {
        auto st = reader.read_lines(lines, 50);
        if (st == LineReader::Status::Eof || st == LineReader::Status::Error) break;
        waited += 50;
    }
    return lines;
}

TEST(Process, CatEchoesStdin) {
    platform::ignore_sigpipe();
    auto p = platform::spawn_piped("cat", {});
    ASSERT_TRUE(p.is_ok()) << p.error;
    auto& proc = p.value;
    EXPECT_TRUE(proc.running());

    ASSERT_TRUE(proc.write_stdin("hello\r\nworld\n").is_ok());
    LineReader reader(proc.stdout_fd());
    auto lines = read_until(reader, 2);
    EXPECT_EQ(lines, (std::vector<std::string>{"hello", "world"}));

    proc.close_stdin();
    EXPECT_EQ(proc.wait(2000), 0);
    EXPECT_FALSE(proc.running());
}

TEST(Process, FinalUnterminatedLineReturnedAtEof) {
    auto p = platform::spawn_piped("/bin/sh", {"-c", "printf 'a\\nb'"});
    ASSERT_TRUE(p.is_ok());
    LineReader reader(p.value.stdout_fd());

    std::vector<std::string> lines;
    LineReader::Status st = LineReader::Status::Idle;
    for (int i = 0; i < 40 && st != LineReader::Status::Eof; i++) {
        st = reader.read_lines(lines, 50);
    }
    EXPECT_EQ(st, LineReader::Status::Eof);
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b"}));
}

TEST(Process, MissingProgramExits127) {
    auto p = platform::spawn_piped("/nonexistent/meshcli", {});
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.value.wait(2000), 127);
}

TEST(Process, TerminateEscalatesToKill) {
    // Ignores SIGTERM, so only SIGKILL ends it
    auto p = platform::spawn_piped("/bin/sh", {"-c", "trap '' TERM; while true; do sleep 1; done"});
    ASSERT_TRUE(p.is_ok());
    platform::sleep_ms(100);
    p.value.terminate(200);
    EXPECT_FALSE(p.value.running());
    EXPECT_EQ(p.value.exit_status().value_or(0), 128 + SIGKILL);
}

TEST(Process, WriteAfterExitFails) {
    platform::ignore_sigpipe();
    auto p = platform::spawn_piped("/bin/sh", {"-c", "exit 3"});
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.value.wait(2000), 3);

    Result<void> w = Result<void>::Ok();
    // The pipe may absorb one write before the reader's end is noticed gone
    for (int i = 0; i < 3 && w.is_ok(); i++) w = p.value.write_stdin("ping\n");
    EXPECT_TRUE(w.is_err());
}
