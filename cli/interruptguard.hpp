#ifndef INTERRUPTGUARD_HPP
#define INTERRUPTGUARD_HPP

#include <atomic>

/**
 * @brief Routes SIGINT to a cancel flag for the lifetime of the guard
 *
 * While the guard exists, Ctrl-C sets @p flag instead of terminating the
 * process, so a running walk can stop between directory visits. The
 * previous handler is restored on destruction; after that, Ctrl-C behaves
 * as it did before (normally: terminate).
 *
 * Only one guard may be active at a time.
 */
class InterruptGuard {
private:
  using Handler = void (*)(int);

  Handler m_previous = nullptr;
  bool m_installed = false;

public:
  explicit InterruptGuard(std::atomic<bool> &flag);
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard &) = delete;
  InterruptGuard &operator=(const InterruptGuard &) = delete;

  /** @brief false if the handler could not be installed */
  bool installed() const { return m_installed; }
};

#endif // INTERRUPTGUARD_HPP
