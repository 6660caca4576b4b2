#ifndef STDOUTREDIRECT_HPP
#define STDOUTREDIRECT_HPP

#include <cstdio>
#include <iostream>
#include <unistd.h>

/**
 * @brief Points file descriptor 1 at stderr for the lifetime of the object
 *
 * FTXUI draws on std::cout. While the picker runs, that output has to go
 * to the terminal through stderr so that `dir=$(pf)` captures nothing but
 * the selected path, which is printed after the original stdout is back.
 */
class StdoutRedirect {
private:
  int m_saved_fd = -1;

public:
  StdoutRedirect() {
    std::cout.flush();
    std::fflush(stdout);

    m_saved_fd = dup(STDOUT_FILENO);
    if (m_saved_fd >= 0 && dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
      close(m_saved_fd);
      m_saved_fd = -1;
    }
  }

  ~StdoutRedirect() {
    if (m_saved_fd < 0)
      return;

    std::cout.flush();
    std::fflush(stdout);
    dup2(m_saved_fd, STDOUT_FILENO);
    close(m_saved_fd);
  }

  StdoutRedirect(const StdoutRedirect &) = delete;
  StdoutRedirect &operator=(const StdoutRedirect &) = delete;

  /** @brief False if stdout could not be redirected */
  bool active() const { return m_saved_fd >= 0; }
};

#endif // STDOUTREDIRECT_HPP
