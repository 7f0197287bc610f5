#include "apirest/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "apirest/base-fd.hpp"
#include "apirest/errno-throw.hpp"
#include "apirest/log.hpp"

namespace apirest {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (fd() == -1) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  static constexpr eventfd_t one = 1;
  if (::eventfd_write(fd(), one) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("Event fd send failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("Event fd read failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

}  // namespace apirest
