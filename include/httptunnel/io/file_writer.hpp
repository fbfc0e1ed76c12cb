#pragma once

#include "httptunnel/core/error.hpp"
#include <cerrno>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace httptunnel::io {

// Writes every iovec, retrying short writes, EINTR and EAGAIN. Any other
// failure is returned as the errno value.
inline Status WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      return std::unexpected(
          ErrorCode(errno, boost::system::system_category()));
    }
    ssize_t consumed = n;
    while (consumed > 0 && cnt > 0) {
      if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
        consumed -= static_cast<ssize_t>(iov[0].iov_len);
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= static_cast<std::size_t>(consumed);
        consumed = 0;
      }
    }
  }
  return {};
}

} // namespace httptunnel::io
