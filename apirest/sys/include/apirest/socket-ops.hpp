#pragma once

#include <cstddef>
#include <cstdint>

namespace apirest {

// Thin wrappers centralising socket system calls.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
bool SetTcpNoDelay(int fd) noexcept;

// Send data on a connected socket without raising SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

// Shutdown the write half of a socket connection.
bool ShutdownWrite(int fd) noexcept;

}  // namespace apirest
