/* @file ConsoleChannel.cpp
 * @brief operator console I/O - fd handling, line framing, poll timeouts, RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Autopilot headers
#include "io/ConsoleChannel.hpp"

using namespace autopilot::io;

ConsoleChannel::~ConsoleChannel() { close(); }

ConsoleChannel::ConsoleChannel(ConsoleChannel&& other) noexcept
    : inFd_(std::exchange(other.inFd_, -1)), outFd_(std::exchange(other.outFd_, -1)),
      owns_(std::exchange(other.owns_, false)), eof_(other.eof_),
      rx_buffer_(std::move(other.rx_buffer_)) {}

ConsoleChannel& ConsoleChannel::operator=(ConsoleChannel&& other) noexcept {
  if (this != &other) {
    close();
    inFd_ = std::exchange(other.inFd_, -1);
    outFd_ = std::exchange(other.outFd_, -1);
    owns_ = std::exchange(other.owns_, false);
    eof_ = other.eof_;
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool ConsoleChannel::open(int inFd, int outFd, bool takeOwnership) {
  close();
  if (inFd < 0) {
    std::cerr << "ConsoleChannel: invalid input fd\n";
    return false;
  }
  inFd_ = inFd;
  outFd_ = outFd;
  owns_ = takeOwnership;
  eof_ = false;
  rx_buffer_.clear();
  return true;
}

// Replies may span several lines (help, report); each goes out whole,
// with exactly one terminating newline.
bool ConsoleChannel::writeLine(const std::string& line) {
  if (outFd_ < 0)
    return false;

  std::string pending = line;
  while (!pending.empty() && (pending.back() == '\n' || pending.back() == '\r'))
    pending.pop_back();
  pending.push_back('\n');

  const char* cursor = pending.data();
  std::size_t left = pending.size();
  while (left > 0) {
    const ssize_t n = ::write(outFd_, cursor, left);
    if (n >= 0) {
      cursor += n;
      left -= static_cast<std::size_t>(n);
      continue;
    }
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      pollfd pfd{ outFd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 50);
      continue;
    }
    std::cerr << "[ConsoleChannel] write failed: " << std::strerror(errno) << "\n";
    return false;
  }
  return true;
}

std::optional<std::string> ConsoleChannel::takeBufferedLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;
  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

// -------------------------------------------------------------------
// ConsoleChannel::readLine
// Line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, EOF, or error; eof() tells them apart.
// -------------------------------------------------------------------
std::optional<std::string> ConsoleChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto buffered = takeBufferedLine())
    return buffered;
  if (inFd_ < 0 || eof_)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ inFd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(inFd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF: hand out a trailing unterminated line once
        eof_ = true;
        if (rx_buffer_.empty())
          return std::nullopt;
        std::string rest = std::move(rx_buffer_);
        rx_buffer_.clear();
        return rest;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeBufferedLine())
        return line;
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      eof_ = true;
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout/partial
}

void ConsoleChannel::close() {
  if (owns_) {
    if (inFd_ >= 0)
      ::close(inFd_);
    if (outFd_ >= 0 && outFd_ != inFd_)
      ::close(outFd_);
  }
  inFd_ = -1;
  outFd_ = -1;
  owns_ = false;
}
