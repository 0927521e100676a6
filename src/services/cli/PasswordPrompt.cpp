#include "PasswordPrompt.hpp"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

namespace {

// Restores the terminal mode on scope exit, including when reading throws.
class EchoOff {
public:
  explicit EchoOff(int fd) : fd_(fd) {
    if (tcgetattr(fd_, &saved_) != 0) return;
    termios quiet = saved_;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    active_ = tcsetattr(fd_, TCSAFLUSH, &quiet) == 0;
  }
  ~EchoOff() {
    if (active_) tcsetattr(fd_, TCSAFLUSH, &saved_);
  }
  EchoOff(const EchoOff&) = delete;
  EchoOff& operator=(const EchoOff&) = delete;

private:
  int fd_;
  termios saved_{};
  bool active_ = false;
};

} // namespace

namespace fixity {

std::string prompt_password(const std::string& prompt) {
  FILE* tty = std::fopen("/dev/tty", "r+");
  if (!tty) {
    std::string line;
    if (!std::getline(std::cin, line)) throw std::runtime_error("no password given");
    return line;
  }

  std::string password;
  {
    std::fputs(prompt.c_str(), tty);
    std::fflush(tty);
    EchoOff guard(fileno(tty));
    int c;
    while ((c = std::fgetc(tty)) != EOF && c != '\n' && c != '\r')
      password.push_back(static_cast<char>(c));
  }
  std::fputc('\n', tty);
  std::fclose(tty);
  return password;
}

} // namespace fixity
