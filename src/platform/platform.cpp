#include "platform.hpp"
#include <csignal>
#include <unistd.h>

namespace platform {

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

void ignore_sigpipe() {
    struct sigaction sa = {};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGPIPE, &sa, nullptr);
}

} // namespace platform
