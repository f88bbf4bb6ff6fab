#include "interruptguard.hpp"

#include <csignal>

#include "log.hpp"

namespace {

std::atomic<std::atomic<bool> *> g_target{nullptr};

void handleInterrupt(int) {
  std::atomic<bool> *flag = g_target.load();
  if (flag)
    flag->store(true);
}

} // namespace

InterruptGuard::InterruptGuard(std::atomic<bool> &flag) {
  g_target.store(&flag);
  Handler previous = std::signal(SIGINT, handleInterrupt);
  if (previous == SIG_ERR) {
    g_target.store(nullptr);
    return;
  }
  m_previous = previous;
  m_installed = true;
}

InterruptGuard::~InterruptGuard() {
  if (!m_installed)
    return;
  if (std::signal(SIGINT, m_previous) == SIG_ERR)
    TP_LOGW("cannot restore previous SIGINT handler");
  g_target.store(nullptr);
}
