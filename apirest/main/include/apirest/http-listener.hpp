#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "apirest/api-rest-config.hpp"
#include "apirest/base-fd.hpp"
#include "apirest/dispatch-gate.hpp"
#include "apirest/event-fd.hpp"
#include "apirest/event-loop.hpp"
#include "apirest/event-source.hpp"
#include "apirest/event.hpp"
#include "apirest/http-parser.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/internal/handler-tracker.hpp"
#include "apirest/internal/lifecycle.hpp"
#include "apirest/resource-handlers.hpp"
#include "apirest/socket.hpp"
#include "apirest/stream-selector.hpp"
#include "apirest/timedef.hpp"
#include "apirest/tls-context.hpp"
#include "apirest/transport.hpp"
#include "apirest/websocket-constants.hpp"

namespace apirest {

struct HttpListenerOptions {
  // Upper bound of epoll_wait, drives the periodic maintenance (drain deadline, idle sweep).
  std::chrono::milliseconds pollInterval{50};
  // Keep-alive connections idle for longer are closed.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{30}};
  HttpParserLimits parserLimits;
  std::size_t maxWebSocketPayload{64UL * 1024UL};
  // Requests arriving while this many handlers are running are answered with 503.
  std::size_t maxConcurrentHandlers{256};
  // Invoked on the reactor thread at the start of each loop iteration. An exception thrown from it ends run() like
  // an event loop failure.
  std::function<void()> iterationHook;
};

// HTTP/1.1 (+TLS, +websocket) listener built on a single-threaded epoll reactor.
//
// The listening socket is bound at construction, so that bind errors are reported synchronously and port() is known
// before run() is called. run() blocks the calling thread until a drain, requested with beginDrain() from any thread,
// completes or times out.
//
// Resource handlers run outside of the reactor, one thread per request, registered in the given tracker. Their
// responses, as well as the events to push on websocket connections, are handed back to the reactor through a mailbox
// woken up by an eventfd. Reading from a connection is suspended while its handler runs.
class HttpListener {
 public:
  // Throws std::invalid_argument if the address is not an IPv4 address, std::system_error if it cannot be bound.
  HttpListener(std::shared_ptr<const DispatchGate> gate, std::shared_ptr<ResourceHandlers> handlers,
               std::shared_ptr<EventSource> events, std::shared_ptr<const TlsContext> tlsContext,
               std::shared_ptr<internal::HandlerTracker> handlerTracker, HttpListenerOptions options = {});

  HttpListener(const HttpListener&) = delete;
  HttpListener(HttpListener&&) = delete;
  HttpListener& operator=(const HttpListener&) = delete;
  HttpListener& operator=(HttpListener&&) = delete;

  ~HttpListener();

  // Actual bound port (resolved if 0 was configured).
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] const ApiRestConfig& config() const noexcept { return _gate->config(); }

  [[nodiscard]] bool isTls() const noexcept { return static_cast<bool>(_tlsContext); }

  // Serve until drained. Throws on unrecoverable event loop failures.
  void run();

  // Thread-safe. Stop accepting connections immediately, let in-flight requests complete for at most maxWait, then
  // close everything. Calling it again can only shorten the deadline.
  void beginDrain(std::chrono::milliseconds maxWait) noexcept;

  [[nodiscard]] std::size_t nbConnections() const noexcept { return _nbConnections.load(std::memory_order_relaxed); }

 private:
  struct Connection {
    enum class Phase : uint8_t { Http, Processing, WebSocket };

    uint64_t id{0};
    BaseFd fd;
    std::unique_ptr<ITransport> transport;
    std::string inBuffer;
    std::string outBuffer;
    SteadyTimePoint lastActivity;
    EventSource::SubscriptionId subscription{0};
    Phase phase{Phase::Http};
    bool subscribed{false};
    bool writeInterest{false};
    bool closeAfterWrite{false};
    bool closeFrameSent{false};
    bool peerClosed{false};
  };

  // Messages posted to the reactor from handler threads and event producers.
  struct Mailbox {
    struct Completion {
      int fd;
      uint64_t cnxId;
      std::string data;
      bool closeAfterWrite;
    };

    struct Push {
      int fd;
      uint64_t cnxId;
      std::string payload;
    };

    void postCompletion(Completion completion);
    void postPush(Push push);

    std::mutex mutex;
    std::vector<Completion> completions;
    std::vector<Push> pushes;
    EventFd eventFd;
  };

  using ConnectionMap = std::unordered_map<int, Connection>;
  using ConnectionIt = ConnectionMap::iterator;

  void eventLoopIteration();
  void acceptNewConnections();
  void handleReadable(int fd, EventBmp eventBmp);
  void handleWritable(int fd);
  void processMailbox();
  void maintenance();

  // Returns false if the connection was closed.
  bool processInput(ConnectionIt cnxIt);
  bool processHttpInput(ConnectionIt cnxIt);
  bool processWebSocketInput(ConnectionIt cnxIt);
  // Answer given status and close the connection once sent. Returns false if the connection was closed.
  bool rejectInput(ConnectionIt cnxIt, http::StatusCode status, std::string_view reason);
  bool serviceUnavailable(ConnectionIt cnxIt, bool headRequest);
  bool dispatchRequest(ConnectionIt cnxIt, HttpRequest request);
  bool upgradeToWebSocket(ConnectionIt cnxIt, const HttpRequest& request);

  void queueOutput(Connection& cnx, std::string_view data);
  // Returns false if the connection was closed.
  bool flushOutput(ConnectionIt cnxIt);
  void updateWriteInterest(Connection& cnx, bool enable);
  void updateInterest(Connection& cnx);
  // Queue a close frame and close the connection once it is sent. Returns false if the connection was closed.
  bool closeWebSocket(ConnectionIt cnxIt, websocket::CloseCode code, std::string_view reason);

  void startDrain();
  void closeListener() noexcept;
  ConnectionIt closeConnection(ConnectionIt cnxIt);
  void closeAllConnections();

  std::shared_ptr<const DispatchGate> _gate;
  std::shared_ptr<ResourceHandlers> _handlers;
  std::shared_ptr<EventSource> _events;
  std::shared_ptr<const TlsContext> _tlsContext;
  std::shared_ptr<internal::HandlerTracker> _handlerTracker;
  HttpListenerOptions _options;
  StreamSelector _selector;
  Socket _listenSocket;
  uint16_t _port;
  EventLoop _eventLoop;
  internal::Lifecycle _lifecycle;
  std::shared_ptr<Mailbox> _mailbox;
  ConnectionMap _connections;
  std::atomic<std::size_t> _nbConnections{0};
  uint64_t _nextConnectionId{1};
  std::string _readBuffer;
};

}  // namespace apirest
