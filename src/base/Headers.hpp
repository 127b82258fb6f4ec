#ifndef __OX_HEADERS__
#define __OX_HEADERS__

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#elif defined(_MSC_VER) || defined(WIN32)
#include <signal.h>
#include <tchar.h>
#include <windows.h>
#include <winerror.h>

#include <codecvt>
#else
#include <pty.h>
#include <signal.h>
#endif

#ifdef WIN32
#include <io.h>
#else
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <pwd.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <locale>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "easylogging++.h"
#include "sago/platform_folders.h"

#if !defined(__ANDROID__)
#include "ust.hpp"
#endif

#ifdef WITH_UTEMPTER
#include <utempter.h>
#endif

#if defined(_MSC_VER)
/* On MSVC, ssize_t is SSIZE_T */
#include <BaseTsd.h>
#define ssize_t SSIZE_T
#endif

using namespace std;
namespace fs = std::filesystem;

#if defined(__ANDROID__)
#define STFATAL LOG(FATAL) << "No Stack Trace on Android" << endl

#define STERROR LOG(ERROR) << "No Stack Trace on Android" << endl
#else
#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()
#endif

inline int GetErrno() {
#ifdef WIN32
  return (int)GetLastError();
#else
  return errno;
#endif
}

inline void SetErrno(int e) {
#ifdef WIN32
  SetLastError((DWORD)e);
#else
  errno = e;
#endif
}

#ifdef WIN32
inline string WinErrorToString(DWORD error) {
  const int BUFSIZE = 4096;
  char buf[BUFSIZE];
  auto charsWritten = FormatMessageA(
      FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL, error,
      MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), buf, BUFSIZE, NULL);
  if (charsWritten) {
    string s(buf, charsWritten);
    // FormatMessage terminates with CRLF
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
      s.pop_back();
    }
    return s;
  }
  return "Unknown Error";
}

inline string WinErrnoToString() { return WinErrorToString(GetLastError()); }

inline std::wstring Utf8ToWide(const string &s) {
  std::wstring_convert<std::codecvt_utf8_utf16<wchar_t>> converter;
  return converter.from_bytes(s);
}

inline string WideToUtf8(const std::wstring &s) {
  std::wstring_convert<std::codecvt_utf8_utf16<wchar_t>> converter;
  return converter.to_bytes(s);
}

#define STDIN_FILENO fileno(stdin)
#define STDOUT_FILENO fileno(stdout)

#endif

#ifndef OX_VERSION
#define OX_VERSION "unknown"
#endif

namespace ox {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/** @brief Splits on runs of spaces and tabs, dropping empty tokens. */
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::stringstream ss(s);
  std::string item;
  while (ss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline string trim(const string &s) {
  const char *ws = " \t\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == string::npos) {
    return string();
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)::tolower(c); });
  return s;
}

inline string GetTempDirectory() {
#ifdef WIN32
  WCHAR buf[MAX_PATH + 1];
  DWORD retval = GetTempPathW(MAX_PATH + 1, buf);
  return WideToUtf8(wstring(buf, retval));
#else
  string tmpDir = _PATH_TMP;
  return tmpDir;
#endif
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace ox

#endif  // __OX_HEADERS__
