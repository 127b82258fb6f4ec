#include "SubprocessUtils.hpp"

namespace ox {
string SubprocessUtils::firstLine(const string& output) {
  for (const auto& line : split(output, '\n')) {
    string trimmed = trim(line);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  return string();
}

#ifdef WIN32
#define BUFSIZE 4096

string SubprocessUtils::SubprocessToStringInteractive(
    const string& command, const vector<string>& args) {
  SECURITY_ATTRIBUTES saAttr;
  HANDLE childStdOutRead = NULL;
  HANDLE childStdOutWrite = NULL;

  // Set the bInheritHandle flag so pipe handles are inherited.
  saAttr.nLength = sizeof(SECURITY_ATTRIBUTES);
  saAttr.bInheritHandle = TRUE;
  saAttr.lpSecurityDescriptor = NULL;

  if (!CreatePipe(&childStdOutRead, &childStdOutWrite, &saAttr, 0)) {
    throw std::runtime_error("CreatePipe failed: " + WinErrnoToString());
  }
  // Only the write end belongs to the child.
  if (!SetHandleInformation(childStdOutRead, HANDLE_FLAG_INHERIT, 0)) {
    string error = WinErrnoToString();
    CloseHandle(childStdOutRead);
    CloseHandle(childStdOutWrite);
    throw std::runtime_error("SetHandleInformation failed: " + error);
  }

  string localCommand = "\"" + command + "\"";
  for (const auto& arg : args) {
    localCommand += " ";
    localCommand += arg;
  }

  PROCESS_INFORMATION piProcInfo;
  ZeroMemory(&piProcInfo, sizeof(PROCESS_INFORMATION));
  STARTUPINFOW siStartInfo;
  ZeroMemory(&siStartInfo, sizeof(STARTUPINFOW));
  siStartInfo.cb = sizeof(STARTUPINFOW);
  siStartInfo.hStdError = NULL;
  siStartInfo.hStdOutput = childStdOutWrite;
  siStartInfo.hStdInput = NULL;
  siStartInfo.dwFlags |= STARTF_USESTDHANDLES;

  std::wstring wide = Utf8ToWide(localCommand);
  BOOL bSuccess = CreateProcessW(NULL, &(wide[0]), NULL, NULL,
                                 TRUE,  // handles are inherited
                                 CREATE_NO_WINDOW, NULL, NULL, &siStartInfo,
                                 &piProcInfo);
  // The child holds its own copy of the write end; closing ours lets
  // ReadFile see the end of the stream.
  CloseHandle(childStdOutWrite);
  if (!bSuccess) {
    string error = WinErrnoToString();
    CloseHandle(childStdOutRead);
    throw std::runtime_error("CreateProcess failed for " + command + ": " +
                             error);
  }

  DWORD dwRead;
  CHAR chBuf[BUFSIZE];
  string childOutput;
  for (;;) {
    bSuccess = ReadFile(childStdOutRead, chBuf, BUFSIZE, &dwRead, NULL);
    if (!bSuccess || dwRead == 0) break;
    childOutput += string((const char*)chBuf, (size_t)dwRead);
  }

  WaitForSingleObject(piProcInfo.hProcess, INFINITE);
  CloseHandle(piProcInfo.hProcess);
  CloseHandle(piProcInfo.hThread);
  CloseHandle(childStdOutRead);
  return childOutput;
}
#else
void SubprocessUtils::createCloseOnExecPipe(int fds[2]) {
  if (::pipe(fds) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(GetErrno()));
  }
  try {
    RawIoUtils::setCloseOnExec(fds[0]);
    RawIoUtils::setCloseOnExec(fds[1]);
  } catch (const PtyException&) {
    ::close(fds[0]);
    ::close(fds[1]);
    throw;
  }
}

string SubprocessUtils::SubprocessToStringInteractive(
    const string& command, const vector<string>& args) {
  int link_client[2];
  char buf_client[4096];
  createCloseOnExecPipe(link_client);

  // argv is built before forking so the child only calls async-signal-safe
  // functions.
  vector<string> argvStorage;
  argvStorage.push_back(command);
  argvStorage.insert(argvStorage.end(), args.begin(), args.end());
  vector<char*> argsArray;
  for (auto& arg : argvStorage) {
    argsArray.push_back(&arg[0]);
  }
  argsArray.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    close(link_client[0]);
    close(link_client[1]);
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      dup2(devNull, STDERR_FILENO);
      close(devNull);
    }
    execvp(command.c_str(), &argsArray[0]);
    _exit(127);
  } else if (pid > 0) {
    // parent process
    close(link_client[1]);
    string output;
    while (true) {
      ssize_t nbytes = read(link_client[0], buf_client, sizeof(buf_client));
      if (nbytes < 0 && GetErrno() == EINTR) {
        continue;
      }
      if (nbytes <= 0) {
        break;
      }
      output += string(buf_client, nbytes);
    }
    close(link_client[0]);
    int status;
    while (waitpid(pid, &status, 0) < 0 && GetErrno() == EINTR) {
    }
    return output;
  } else {
    int forkErrno = GetErrno();
    close(link_client[0]);
    close(link_client[1]);
    throw std::runtime_error(string("fork failed: ") + strerror(forkErrno));
  }
}
#endif

}  // namespace ox
