#pragma once

#include <execinfo.h>
#include <unistd.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace userapi {

inline void printGlibcBacktrace(int signo, siginfo_t *si, [[maybe_unused]] void *context) {
  void *array[100];

  char message[1024];
  ::snprintf(message, sizeof(message), "userapi: fatal signal %d (code %d, addr %p). Backtrace:\n",
             signo, si->si_code, si->si_addr);
  ::write(STDERR_FILENO, message, ::strnlen(message, sizeof(message)));
  // Not AS-Safe, so just pray we're not in a signal handler that interrupted malloc
  auto size = ::backtrace(array, 100);
  ::backtrace_symbols_fd(array, size, STDERR_FILENO);
  _exit(EXIT_FAILURE);
}

// Crash signals print a backtrace. SIGINT/SIGTERM are left to the server's
// signal_set, and SIGPIPE is ignored so a peer closing mid-write only fails
// the write.
inline void initializeSignalHandlers() {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_sigaction = printGlibcBacktrace;
  action.sa_flags = SA_SIGINFO | SA_RESETHAND;
  sigemptyset(&action.sa_mask);
  ::sigaction(SIGSEGV, &action, nullptr);
  ::sigaction(SIGABRT, &action, nullptr);
  ::sigaction(SIGILL, &action, nullptr);
  ::sigaction(SIGFPE, &action, nullptr);
  ::sigaction(SIGBUS, &action, nullptr);

  struct sigaction ignore;
  std::memset(&ignore, 0, sizeof(ignore));
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  ::sigaction(SIGPIPE, &ignore, nullptr);
}

} // namespace userapi
