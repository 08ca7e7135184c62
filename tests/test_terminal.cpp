#include "minitest.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>
#include <string>
#include <thread>

using namespace spytrap;

namespace {

struct Pipe {
  int rd{-1};
  int wr{-1};
  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == 0) { rd = fds[0]; wr = fds[1]; }
    if (wr >= 0) (void)::fcntl(wr, F_SETFL, ::fcntl(wr, F_GETFL, 0) | O_NONBLOCK);
  }
  ~Pipe() {
    if (rd >= 0) ::close(rd);
    if (wr >= 0) ::close(wr);
  }
};

std::string read_all(int fd) {
  std::string out;
  char buf[8192];
  ssize_t n;
  while ((n = ::read(fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
  return out;
}

} // namespace

TEST(write_all_finishes_frame_larger_than_pipe) {
  Pipe p;
  ASSERT_TRUE(p.wr >= 0);
  std::string frame;
  for (int i = 0; frame.size() < (1u << 20); ++i) frame += "row " + std::to_string(i) + " \x1B[K\n";
  std::string got;
  std::thread reader([&]{ got = read_all(p.rd); });
  bool ok = ui::write_all(p.wr, frame.data(), frame.size());
  ::close(p.wr);
  p.wr = -1;
  reader.join();
  ASSERT_TRUE(ok);
  ASSERT_EQ(got.size(), frame.size());
  ASSERT_TRUE(got == frame);
}

TEST(write_all_gives_up_on_stalled_reader) {
  Pipe p;
  std::string big(1u << 20, 'x');
  ASSERT_TRUE(!ui::write_all(p.wr, big.data(), big.size(), 20));
}

TEST(write_all_reports_bad_fd) {
  ASSERT_TRUE(!ui::write_all(-1, "abc", 3));
  ASSERT_TRUE(ui::write_all(-1, "", 0));
}

TEST(screen_clear_writes_full_sequence) {
  Pipe p;
  ui::Screen screen(p.wr);
  screen.clear();
  ::close(p.wr);
  p.wr = -1;
  ASSERT_EQ(read_all(p.rd), "\x1B[2J\x1B[H");
}

TEST(term_size_falls_back_to_env) {
  if (::isatty(STDOUT_FILENO) == 1) return; // real tty size wins
  const char* oc = std::getenv("COLUMNS");
  const char* orows = std::getenv("LINES");
  std::string sc = oc ? oc : "", sr = orows ? orows : "";
  ::setenv("COLUMNS", "132", 1);
  ::setenv("LINES", "junk", 1);
  ASSERT_EQ(ui::term_cols(), 132);
  ASSERT_EQ(ui::term_rows(), 24);
  if (oc) ::setenv("COLUMNS", sc.c_str(), 1); else ::unsetenv("COLUMNS");
  if (orows) ::setenv("LINES", sr.c_str(), 1); else ::unsetenv("LINES");
}
