#include "apirest/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "apirest/base64.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/log.hpp"
#include "apirest/socket.hpp"
#include "apirest/string-equal-ignore-case.hpp"

namespace apirest::test {

namespace {

bool ConnectOnce(int fd, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  return ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

std::string ToLower(std::string_view input) {
  std::string ret(input);
  for (char& ch : ret) {
    ch = ToLowerAscii(ch);
  }
  return ret;
}

// Returns the expected total size of the response if its head is complete and it has a Content-Length.
std::optional<std::size_t> ExpectedResponseSize(std::string_view data) {
  const auto headerEnd = data.find("\r\n\r\n");
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string head = ToLower(data.substr(0, headerEnd));
  const auto clPos = head.find("\r\ncontent-length:");
  if (clPos == std::string::npos) {
    // 1xx, 204 and bodyless responses
    if (head.starts_with("http/1.1 1") || head.starts_with("http/1.1 204")) {
      return headerEnd + 4;
    }
    return std::nullopt;
  }
  auto valueStart = clPos + std::string_view("\r\ncontent-length:").size();
  while (valueStart < head.size() && head[valueStart] == ' ') {
    ++valueStart;
  }
  std::size_t contentLength = 0;
  const auto [ptr, ec] = std::from_chars(head.data() + valueStart, head.data() + head.size(), contentLength);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  return headerEnd + 4 + contentLength;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(Socket::Type::Stream) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!ConnectOnce(_socket.fd(), port)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw std::runtime_error("Unable to connect to port " + std::to_string(port));
    }
    std::this_thread::sleep_for(1ms);
    // a failed connect leaves the socket in an unspecified state
    _socket = Socket(Socket::Type::Stream);
  }
}

std::string_view ParsedResponse::header(std::string_view name) const {
  const auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string_view{} : std::string_view(it->second);
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent <= 0) {
      if (errno != EAGAIN && errno != EINTR) {
        log::error("sendAll failed with error {}", std::strerror(errno));
        return false;
      }
      if (std::chrono::steady_clock::now() >= maxTs) {
        log::error("sendAll timed out after {} ms", totalTimeout.count());
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  char buf[16 * 1024];
  while (std::chrono::steady_clock::now() < maxTs) {
    const auto expected = ExpectedResponseSize(out);
    if (expected && out.size() >= *expected) {
      break;
    }
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 10);
    if (ready <= 0) {
      continue;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
  return out;
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  char buf[16 * 1024];
  while (std::chrono::steady_clock::now() < maxTs) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 10);
    if (ready <= 0) {
      continue;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
  return out;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  const auto statusLineEnd = raw.find("\r\n");
  const auto headerEnd = raw.find("\r\n\r\n");
  if (statusLineEnd == std::string_view::npos || headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  ParsedResponse pr;
  const std::string_view statusLine = raw.substr(0, statusLineEnd);
  // Expect: HTTP/1.1 <code> <reason>
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  const auto codeStr = statusLine.substr(firstSpace + 1, 3);
  const auto [ptr, ec] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), pr.statusCode);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  if (statusLine.size() > firstSpace + 5) {
    pr.reason = statusLine.substr(firstSpace + 5);
  }

  std::size_t cursor = statusLineEnd + 2;
  while (cursor < headerEnd) {
    const auto lineEnd = raw.find("\r\n", cursor);
    const std::string_view line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + 2;
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    auto value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    pr.headers[ToLower(line.substr(0, colon))] = std::string(value);
  }
  pr.body = raw.substr(headerEnd + 4);
  return pr;
}

ParsedResponse parseResponseOrThrow(std::string_view raw) {
  auto parsed = parseResponse(raw);
  if (!parsed) {
    throw std::runtime_error("Unable to parse HTTP response: '" + std::string(raw.substr(0, 256)) + "'");
  }
  return std::move(*parsed);
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req = opt.method + ' ' + opt.target + " HTTP/1.1\r\nHost: " + opt.host + "\r\n";
  if (!opt.connection.empty()) {
    req += "Connection: " + opt.connection + "\r\n";
  }
  for (const auto& [name, value] : opt.headers) {
    req += name + ": " + value + "\r\n";
  }
  if (!opt.body.empty()) {
    req += "Content-Length: " + std::to_string(opt.body.size()) + "\r\n";
  }
  req += "\r\n";
  req += opt.body;
  return req;
}

std::optional<std::string> request(uint16_t port, const RequestOptions& opt) {
  try {
    ClientConnection cnx(port);
    if (!sendAll(cnx.fd(), buildRequest(opt))) {
      return std::nullopt;
    }
    auto raw = recvWithTimeout(cnx.fd(), opt.timeout);
    if (raw.empty()) {
      return std::nullopt;
    }
    return raw;
  } catch (const std::runtime_error& ex) {
    log::error("request to port {} failed: {}", port, ex.what());
    return std::nullopt;
  }
}

std::string requestOrThrow(uint16_t port, const RequestOptions& opt) {
  auto raw = request(port, opt);
  if (!raw) {
    throw std::runtime_error("request to port " + std::to_string(port) + " failed");
  }
  return std::move(*raw);
}

ParsedResponse simpleGet(uint16_t port, std::string_view path,
                         std::vector<std::pair<std::string, std::string>> extraHeaders) {
  RequestOptions opt;
  opt.target = std::string(path);
  opt.headers = std::move(extraHeaders);
  return parseResponseOrThrow(requestOrThrow(port, opt));
}

std::string BasicAuthorization(std::string_view user, std::string_view password) {
  std::string credentials(user);
  credentials.push_back(':');
  credentials.append(password);
  return "Basic " + B64Encode(credentials);
}

bool AttemptConnect(uint16_t port) {
  Socket sock(Socket::Type::Stream);
  return ConnectOnce(sock.fd(), port);
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[4096];
  while (std::chrono::steady_clock::now() < deadline) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 10);
    if (ready <= 0) {
      continue;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead == 0 || (nbRead == -1 && errno != EAGAIN && errno != EINTR)) {
      return true;
    }
  }
  return false;
}

bool WaitForListenerClosed(uint16_t port, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!AttemptConnect(port)) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return false;
}

}  // namespace apirest::test
