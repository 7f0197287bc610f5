#pragma once

#include <exception>
#include <functional>
#include <mutex>
#include <string_view>

namespace apirest {

// Channel through which the background listener reports an unrecoverable fault to the hosting process, after
// start() already returned. The fault is kept until cleared, and given to the handler if one is set.
class FatalFaultSignal {
 public:
  using Handler = std::function<void(std::exception_ptr)>;

  void setHandler(Handler handler);

  // Record the fault, log it with given reason and call the handler (outside of any lock).
  void raise(std::exception_ptr fault, std::string_view reason);

  [[nodiscard]] bool raised() const;

  // Rethrow the recorded fault, if any.
  void rethrowIfRaised() const;

  void clear();

 private:
  mutable std::mutex _mutex;
  Handler _handler;
  std::exception_ptr _fault;
};

}  // namespace apirest
