#include "codebox/internal/fd.hpp"

#include <fcntl.h>

#include <initializer_list>

#include "codebox/platform.hpp"

namespace codebox::internal {

namespace {

Result<void> add_fd_flag(int fd, int get_cmd, int set_cmd, int flag, const char* context) {
  int flags = ::fcntl(fd, get_cmd);
  if (flags == -1 || ::fcntl(fd, set_cmd, flags | flag) == -1) {
    return errno_error(context);
  }
  return {};
}

}  // namespace

Result<PipeEnds> make_pipe() {
  int fds[2] = {-1, -1};
#if CODEBOX_PLATFORM_LINUX
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    return errno_error("pipe2");
  }
  return PipeEnds{.read_end = unique_fd(fds[0]), .write_end = unique_fd(fds[1])};
#else
  if (::pipe(fds) == -1) {
    return errno_error("pipe");
  }
  PipeEnds ends{.read_end = unique_fd(fds[0]), .write_end = unique_fd(fds[1])};
  for (int fd : {fds[0], fds[1]}) {
    auto flagged = add_fd_flag(fd, F_GETFD, F_SETFD, FD_CLOEXEC, "fcntl(FD_CLOEXEC)");
    if (!flagged) {
      return flagged.error();
    }
  }
  return ends;
#endif
}

Result<void> set_nonblocking(int fd) {
  return add_fd_flag(fd, F_GETFL, F_SETFL, O_NONBLOCK, "fcntl(O_NONBLOCK)");
}

}  // namespace codebox::internal
