#pragma once
/** @file  ConsoleChannel.hpp
 *  @brief Non-blocking line I/O on a pair of file descriptors (stdin/stdout by default).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace autopilot {
  namespace io {

    /**
 * @class ConsoleChannel
 * @brief poll()-based line reader so the operator thread can notice shutdown
 *        between keystrokes instead of blocking forever in read().
 *
 *  * Frames input as `\n`-terminated lines (a trailing `\r` is dropped).
 *  * Closes the descriptors only when opened with takeOwnership.
 *  * *Non-copyable*, but move-constructible.
 */
    class ConsoleChannel {

    public:
      //---ctr / dtr--------------------------------------------
      ConsoleChannel() = default;
      ~ConsoleChannel(); // closes owned fds at destruction

      //---public API-------------------------------------------
      bool open(int inFd, int outFd, bool takeOwnership = false);
      bool writeLine(const std::string& line); // false when no output fd or on write error
      std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      bool eof() const { return eof_; }
      void close();

      //---non-copyable-----------------------------------------
      ConsoleChannel(const ConsoleChannel&) = delete;
      ConsoleChannel& operator=(const ConsoleChannel&) = delete;

      //---mv and mv assign-------------------------------------
      ConsoleChannel(ConsoleChannel&& other) noexcept;
      ConsoleChannel& operator=(ConsoleChannel&& other) noexcept;

    private:
      std::optional<std::string> takeBufferedLine();

      int inFd_{ -1 };          ///< POSIX fd (-1==closed)
      int outFd_{ -1 };
      bool owns_{ false };
      bool eof_{ false };
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };
  } // namespace io
} // namespace autopilot
