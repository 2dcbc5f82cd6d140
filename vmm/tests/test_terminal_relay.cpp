#include <gtest/gtest.h>

#include <unistd.h>

#include "fakes.hpp"
#include "terminal_relay.hpp"

using namespace std::chrono_literals;
using ember::testing::fake_channel_t;

namespace {

struct pipe_t {
  pipe_t() {
    if (::pipe(fds) != 0)
      throw std::runtime_error("pipe() failed");
  }

  ~pipe_t() {
    close_read();
    close_write();
  }

  void close_read() {
    if (fds[0] >= 0)
      ::close(fds[0]);
    fds[0] = -1;
  }

  void close_write() {
    if (fds[1] >= 0)
      ::close(fds[1]);
    fds[1] = -1;
  }

  std::string drain() {
    close_write();
    std::string rv;
    char buf[256];
    ssize_t n;
    while ((n = ::read(fds[0], buf, sizeof(buf))) > 0)
      rv.append(buf, static_cast<size_t>(n));
    return rv;
  }

  int fds[2] = {-1, -1};
};

} // namespace

TEST(EmberTerminalRelayTest, TestRemoteFinished) {
  pipe_t in, out;
  ASSERT_EQ(::write(in.fds[1], "ls\n", 3), 3);
  in.close_write();

  fake_channel_t channel;
  channel.pending = {"hello ", "world"};

  auto end = ember::relay(channel, {.in_fd = in.fds[0],
                                    .out_fd = out.fds[1],
                                    .poll_interval = 10ms});
  ASSERT_EQ(end, ember::relay_end_t::remote_finished);
  ASSERT_EQ(out.drain(), "hello world");
  ASSERT_EQ(channel.written, "ls\n");
}

TEST(EmberTerminalRelayTest, TestLocalEof) {
  pipe_t in, out;
  ASSERT_EQ(::write(in.fds[1], "exit\n", 5), 5);
  in.close_write();

  fake_channel_t channel;
  channel.remote_open = true;

  auto end = ember::relay(channel, {.in_fd = in.fds[0],
                                    .out_fd = out.fds[1],
                                    .poll_interval = 10ms});
  ASSERT_EQ(end, ember::relay_end_t::local_eof);
  ASSERT_EQ(channel.written, "exit\n");
}

TEST(EmberTerminalRelayTest, TestRawModeNeedsTerminal) {
  pipe_t in;
  ember::raw_terminal_t raw(in.fds[0]);
  ASSERT_FALSE(raw.active());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
