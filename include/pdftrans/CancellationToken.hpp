#ifndef PDFTRANS_CANCELLATION_TOKEN_HPP
#define PDFTRANS_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>

namespace pdftrans {

/**
 * @brief Request-scoped cancellation signal with an optional deadline
 *
 * Shared by reference between the caller and the pipeline stages of one
 * request. cancel() may be called from any thread.
 */
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel() { m_cancelled.store(true); }

  /**
   * @brief Expire the token @p seconds from now (<= 0 clears the deadline)
   *
   * Must be set before the token is shared with worker threads.
   */
  void setDeadlineAfter(double seconds) {
    m_hasDeadline = seconds > 0.0;
    if (m_hasDeadline) {
      m_deadline = Clock::now() +
                   std::chrono::duration_cast<Clock::duration>(
                       std::chrono::duration<double>(seconds));
    }
  }

  bool isCancelled() const {
    if (m_cancelled.load()) {
      return true;
    }
    return m_hasDeadline && Clock::now() >= m_deadline;
  }

  bool deadlineExpired() const {
    return m_hasDeadline && Clock::now() >= m_deadline;
  }

private:
  std::atomic<bool> m_cancelled{false};
  bool m_hasDeadline = false;
  Clock::time_point m_deadline{};
};

} // namespace pdftrans

#endif // PDFTRANS_CANCELLATION_TOKEN_HPP
