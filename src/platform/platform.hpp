#pragma once

namespace platform {

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Writes to a pipe whose reader died must fail with EPIPE, not kill the bridge.
void ignore_sigpipe();

} // namespace platform
