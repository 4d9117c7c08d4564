#pragma once

#include <string>
#include <vector>

namespace platform {

// Splits bytes read from a file descriptor into lines.
// Does not own the descriptor.
class LineReader {
public:
    enum class Status { Lines, Idle, Eof, Error };

    explicit LineReader(int fd) : fd_(fd) {}

    // Wait up to timeout_ms for data, then append every complete line
    // (without "\n" or a trailing "\r") to out.
    // Lines means bytes arrived, possibly only part of a line.
    // On Eof, a final unterminated line is returned as well.
    Status read_lines(std::vector<std::string>& out, int timeout_ms);

    // Bytes received after the last newline.
    const std::string& partial() const { return partial_; }

private:
    int fd_;
    std::string partial_;

    void split_into(std::vector<std::string>& out);
};

} // namespace platform
