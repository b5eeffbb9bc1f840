#include "core/Logger.hpp"
#include "io/ConsoleChannel.hpp"
#include "io/FileLogger.hpp"

#include "TempDir.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fcntl.h>
#include <iostream>
#include <regex>
#include <sstream>
#include <unistd.h>

using autopilot::core::LogEvent;
using autopilot::core::Logger;
using autopilot::core::LogLevel;
using autopilot::io::ConsoleChannel;
using autopilot::io::FileLogger;
using autopilot::test::slurp;
using autopilot::test::TempDir;
using ::testing::HasSubstr;

namespace {

  constexpr std::chrono::milliseconds kShort{ 50 };

  void writeAll(int fd, const std::string& s) {
    ASSERT_EQ(::write(fd, s.data(), s.size()), static_cast<ssize_t>(s.size()));
  }

} // namespace

//---ConsoleChannel---------------------------------------------------------------

TEST(console_channel, frames_lines_and_drops_carriage_return) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));

  ConsoleChannel chan;
  ASSERT_TRUE(chan.open(fds[0], -1, true));

  writeAll(fds[1], "pause\r\nresume\npart");
  auto first = chan.readLine(kShort);
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, "pause");
  auto second = chan.readLine(kShort);
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, "resume");

  // unterminated tail is handed out once the writer goes away
  ::close(fds[1]);
  auto tail = chan.readLine(kShort);
  ASSERT_TRUE(tail);
  EXPECT_EQ(*tail, "part");
  EXPECT_TRUE(chan.eof());
  EXPECT_FALSE(chan.readLine(kShort));
}

TEST(console_channel, times_out_without_input) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));

  ConsoleChannel chan;
  ASSERT_TRUE(chan.open(fds[0], -1, true));
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 20 }));
  EXPECT_FALSE(chan.eof());
  ::close(fds[1]);
}

TEST(console_channel, write_line_appends_newline) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));

  ConsoleChannel chan;
  ASSERT_TRUE(chan.open(fds[0], fds[1], true));
  ASSERT_TRUE(chan.writeLine("status ok"));

  char buf[32] = { 0 };
  ASSERT_GT(::read(fds[0], buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "status ok\n");
}

TEST(console_channel, multi_line_reply_gets_single_trailing_newline) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));

  ConsoleChannel chan;
  ASSERT_TRUE(chan.open(fds[0], fds[1], true));
  ASSERT_TRUE(chan.writeLine("Steps completed: 2\nTotal time: 4.0s\n\n"));

  char buf[64] = { 0 };
  ASSERT_GT(::read(fds[0], buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "Steps completed: 2\nTotal time: 4.0s\n");
}

TEST(console_channel, write_line_without_output_fd_fails) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));

  ConsoleChannel chan;
  ASSERT_TRUE(chan.open(fds[0], -1));
  EXPECT_FALSE(chan.writeLine("lost"));
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(console_channel, borrowed_descriptors_stay_open) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  {
    ConsoleChannel chan;
    ASSERT_TRUE(chan.open(fds[0], fds[1]));
  }
  EXPECT_NE(::fcntl(fds[0], F_GETFD), -1);
  EXPECT_NE(::fcntl(fds[1], F_GETFD), -1);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(console_channel, rejects_invalid_input_fd) {
  ConsoleChannel chan;
  EXPECT_FALSE(chan.open(-1, -1));
  EXPECT_FALSE(chan.readLine(kShort));
}

//---FileLogger-------------------------------------------------------------------

TEST(file_logger, buffers_until_flush_and_appends) {
  TempDir dir;
  const auto path = dir.file("run.txt");
  {
    FileLogger log;
    ASSERT_TRUE(log.open(path));
    log.write("one\n");
    ASSERT_TRUE(log.flush());
    EXPECT_EQ(slurp(path), "one\n");
    log.write("two\n");
  } // dtor flushes
  {
    FileLogger log;
    ASSERT_TRUE(log.open(path));
    log.write("three\n");
  }
  EXPECT_EQ(slurp(path), "one\ntwo\nthree\n");
}

TEST(file_logger, open_fails_for_missing_directory) {
  TempDir dir;
  FileLogger log;
  EXPECT_FALSE(log.open(dir.file("no/such/dir/run.txt")));
  EXPECT_FALSE(log.isOpen());
  EXPECT_FALSE(log.flush());
}

//---Logger-----------------------------------------------------------------------

TEST(logger, format_matches_timestamp_level_message) {
  const auto line = Logger::format(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warning,
                                             "region too small" });
  EXPECT_TRUE(std::regex_match(
      line, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2},\d{3} - WARNING - region too small)")))
      << line;
}

TEST(logger, numbered_files_and_drained_on_finish) {
  TempDir dir;
  Logger first{ dir.file("logs"), false };
  first.startNewRun();
  EXPECT_THAT(first.currentFile(), ::testing::EndsWith("log_1.txt"));
  first.info("Found button: 'run command'");
  first.error("Error sending Ctrl+Enter");
  first.finishRun();

  const auto text = slurp(first.currentFile());
  EXPECT_THAT(text, HasSubstr(" - INFO - Found button: 'run command'\n"));
  EXPECT_THAT(text, HasSubstr(" - ERROR - Error sending Ctrl+Enter\n"));
  EXPECT_EQ(first.droppedEvents(), 0u);

  Logger second{ dir.file("logs"), false };
  second.startNewRun();
  EXPECT_THAT(second.currentFile(), ::testing::EndsWith("log_2.txt"));
}

TEST(logger, open_run_echoes_every_line_to_the_console) {
  TempDir dir;
  std::ostringstream captured;
  auto* previous = std::clog.rdbuf(captured.rdbuf());
  {
    Logger log{ dir.file("logs") };
    log.startNewRun();
    log.info("Automation started");
    log.error("Error reading text: engine crashed");
    log.finishRun();
  }
  std::clog.rdbuf(previous);

  EXPECT_THAT(captured.str(), HasSubstr(" - INFO - Automation started\n"));
  EXPECT_THAT(captured.str(), HasSubstr(" - ERROR - Error reading text: engine crashed\n"));
}

TEST(logger, events_before_a_run_do_not_create_files) {
  TempDir dir;
  Logger log{ dir.file("logs"), false };
  log.warn("early");
  EXPECT_TRUE(log.currentFile().empty());
  EXPECT_FALSE(std::filesystem::exists(dir.file("logs")));
}

TEST(logger, unusable_log_dir_throws) {
  TempDir dir;
  const auto blocker = dir.write("logs", "a file");
  Logger log{ blocker, false };
  EXPECT_THROW(log.startNewRun(), std::runtime_error);
}
