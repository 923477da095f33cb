#include "codebox/internal/io_pump.hpp"

#include <poll.h>
#include <pthread.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <ctime>

namespace codebox::internal {

namespace {

constexpr std::size_t kChunkSize = 8192;

// SIGPIPE is blocked on the pumping thread so a child that stops reading produces EPIPE
// rather than killing the host. A SIGPIPE raised meanwhile is consumed before unblocking.
class SigpipeBlock {
 public:
  SigpipeBlock() {
    sigemptyset(&sigpipe_);
    sigaddset(&sigpipe_, SIGPIPE);
    sigset_t pending;
    sigemptyset(&pending);
    already_pending_ = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
    active_ = ::pthread_sigmask(SIG_BLOCK, &sigpipe_, &saved_) == 0;
  }

  ~SigpipeBlock() {
    if (!active_) {
      return;
    }
    sigset_t pending;
    sigemptyset(&pending);
    if (!already_pending_ && ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
      timespec no_wait{};
      while (::sigtimedwait(&sigpipe_, nullptr, &no_wait) == -1 && errno == EINTR) {
      }
    }
    ::pthread_sigmask(SIG_SETMASK, &saved_, nullptr);
  }

  SigpipeBlock(const SigpipeBlock&) = delete;
  SigpipeBlock& operator=(const SigpipeBlock&) = delete;

 private:
  sigset_t sigpipe_{};
  sigset_t saved_{};
  bool active_ = false;
  bool already_pending_ = false;
};

struct Sink {
  unique_fd* fd;
  std::string* out;
};

bool usable(const unique_fd* fd) { return fd != nullptr && fd->is_open(); }

bool would_block(int error) { return error == EAGAIN || error == EWOULDBLOCK; }

}  // namespace

void drop_partial_utf8(std::string& text) {
  auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
  std::size_t size = text.size();
  std::size_t trailing = 0;
  while (trailing < 3 && trailing < size && (byte(size - 1 - trailing) & 0xC0) == 0x80) {
    ++trailing;
  }
  if (trailing == size) {
    return;
  }
  unsigned char lead = byte(size - 1 - trailing);
  std::size_t expected = 0;
  if ((lead & 0xE0) == 0xC0) {
    expected = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    expected = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    expected = 4;
  }
  if (expected > trailing + 1) {
    text.resize(size - 1 - trailing);
  }
}

Result<PumpResult> pump_pipes(unique_fd* stdin_fd, std::string_view input, unique_fd* stdout_fd,
                              unique_fd* stderr_fd, Clock& clock, const PumpLimits& limits) {
  PumpResult result;
  std::array<Sink, 2> sinks = {Sink{stdout_fd, &result.stdout_data},
                               Sink{stderr_fd, &result.stderr_data}};
  for (auto& sink : sinks) {
    if (!usable(sink.fd)) {
      continue;
    }
    if (auto made = set_nonblocking(sink.fd->get()); !made) {
      return made.error();
    }
  }

  std::optional<SigpipeBlock> sigpipe_block;
  std::string_view pending = input;
  if (usable(stdin_fd)) {
    if (pending.empty()) {
      stdin_fd->close();
    } else {
      if (auto made = set_nonblocking(stdin_fd->get()); !made) {
        return made.error();
      }
      sigpipe_block.emplace();
    }
  }

  std::size_t budget = limits.output_limit;
  std::string* last_written = nullptr;
  std::array<char, kChunkSize> chunk{};

  auto keep = [&](Sink& sink, std::size_t count) {
    std::size_t kept = std::min(count, budget);
    if (kept > 0) {
      sink.out->append(chunk.data(), kept);
      budget -= kept;
      last_written = sink.out;
    }
    if (kept < count && !result.truncated) {
      result.truncated = true;
      if (last_written != nullptr) {
        drop_partial_utf8(*last_written);
      }
    }
  };

  while (usable(sinks[0].fd) || usable(sinks[1].fd) || usable(stdin_fd)) {
    int wait_ms = -1;
    if (limits.deadline) {
      auto left = remaining_until(clock, *limits.deadline);
      if (left.count() == 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left.count(), INT_MAX));
    }

    std::array<pollfd, 3> fds{};
    std::array<Sink*, 3> owners{};
    nfds_t count = 0;
    for (auto& sink : sinks) {
      if (usable(sink.fd)) {
        owners[count] = &sink;
        fds[count++] = pollfd{.fd = sink.fd->get(), .events = POLLIN, .revents = 0};
      }
    }
    if (usable(stdin_fd)) {
      owners[count] = nullptr;
      fds[count++] = pollfd{.fd = stdin_fd->get(), .events = POLLOUT, .revents = 0};
    }

    int ready = ::poll(fds.data(), count, wait_ms);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      return errno_error("poll");
    }

    for (nfds_t i = 0; i < count && ready > 0; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (Sink* sink = owners[i]) {
        while (true) {
          ssize_t got = ::read(sink->fd->get(), chunk.data(), chunk.size());
          if (got > 0) {
            keep(*sink, static_cast<std::size_t>(got));
          } else if (got == 0) {
            sink->fd->close();
            break;
          } else if (errno != EINTR) {
            if (would_block(errno)) {
              break;
            }
            return errno_error("read");
          }
        }
        continue;
      }

      ssize_t sent = ::write(stdin_fd->get(), pending.data(), pending.size());
      if (sent >= 0) {
        pending.remove_prefix(static_cast<std::size_t>(sent));
      } else if (errno == EPIPE) {
        // The child closed stdin or exited without reading everything.
        pending = {};
      } else if (errno != EINTR && !would_block(errno)) {
        return errno_error("write");
      }
      if (pending.empty()) {
        stdin_fd->close();
      }
    }
  }

  return result;
}

}  // namespace codebox::internal
