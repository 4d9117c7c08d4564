#include "line_reader.hpp"
#include <core/constants.hpp>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace platform {

static void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

void LineReader::split_into(std::vector<std::string>& out) {
    size_t pos = 0;
    while (pos < partial_.size()) {
        auto nl = partial_.find('\n', pos);
        if (nl == std::string::npos) break;

        std::string line = partial_.substr(pos, nl - pos);
        strip_cr(line);
        out.push_back(std::move(line));
        pos = nl + 1;
    }

    // Keep incomplete line
    if (pos > 0) partial_.erase(0, pos);
}

LineReader::Status LineReader::read_lines(std::vector<std::string>& out, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int pr = poll(&pfd, 1, timeout_ms);
    if (pr == 0) return Status::Idle;
    if (pr < 0) return errno == EINTR ? Status::Idle : Status::Error;

    char buf[PIPE_READ_BUF_SIZE];
    ssize_t n = read(fd_, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return Status::Idle;
        return Status::Error;
    }
    if (n == 0) {
        if (!partial_.empty()) {
            std::string last = std::move(partial_);
            partial_.clear();
            strip_cr(last);
            out.push_back(std::move(last));
        }
        return Status::Eof;
    }

    partial_.append(buf, static_cast<size_t>(n));
    split_into(out);
    return Status::Lines;
}

} // namespace platform
