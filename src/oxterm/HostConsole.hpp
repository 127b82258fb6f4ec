#ifndef __OX_HOST_CONSOLE__
#define __OX_HOST_CONSOLE__

#include "Headers.hpp"
#include "PtyBackend.hpp"

namespace ox {
/**
 * @brief Puts the console oxterm runs in into raw mode and reports its size.
 */
class HostConsole {
 public:
  HostConsole() : active(false) {
#ifdef WIN32
    GetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), &inputMode);
    GetConsoleMode(GetStdHandle(STD_OUTPUT_HANDLE), &outputMode);
#else
    tcgetattr(STDIN_FILENO, &terminalBackup);
#endif
  }

  virtual ~HostConsole() { teardown(); }

  /** @brief True when stdin is an interactive terminal. */
  static bool isInteractive() {
#ifdef WIN32
    DWORD mode;
    return GetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), &mode) != 0;
#else
    return ::isatty(STDIN_FILENO) != 0;
#endif
  }

  /** @brief Switches stdin to raw mode so every key reaches the shell. */
  void setup() {
    if (active) {
      return;
    }
#ifdef WIN32
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE),
                   ENABLE_VIRTUAL_TERMINAL_INPUT);
    SetConsoleMode(GetStdHandle(STD_OUTPUT_HANDLE),
                   outputMode | ENABLE_PROCESSED_OUTPUT |
                       ENABLE_VIRTUAL_TERMINAL_PROCESSING);
#else
    termios terminalLocal;
    tcgetattr(STDIN_FILENO, &terminalLocal);
    memcpy(&terminalBackup, &terminalLocal, sizeof(struct termios));
    cfmakeraw(&terminalLocal);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalLocal);
#endif
    active = true;
  }

  /** @brief Restores the mode saved by setup(). */
  void teardown() {
    if (!active) {
      return;
    }
#ifdef WIN32
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), inputMode);
    SetConsoleMode(GetStdHandle(STD_OUTPUT_HANDLE), outputMode);
#else
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalBackup);
#endif
    active = false;
  }

  /** @brief Visible window size, 24x80 when it cannot be queried. */
  TerminalSize getSize() const {
#ifdef WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (!GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi)) {
      return TerminalSize();
    }
    return TerminalSize(csbi.srWindow.Bottom - csbi.srWindow.Top + 1,
                        csbi.srWindow.Right - csbi.srWindow.Left + 1);
#else
    winsize win;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_row == 0 ||
        win.ws_col == 0) {
      return TerminalSize();
    }
    return TerminalSize(win.ws_row, win.ws_col);
#endif
  }

 protected:
  bool active;
#ifdef WIN32
  DWORD inputMode;
  DWORD outputMode;
#else
  termios terminalBackup;
#endif
};
}  // namespace ox

#endif  // __OX_HOST_CONSOLE__
