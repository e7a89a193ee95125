/**
 * @file ShutdownSignal.hpp
 * @brief One-shot cancellation flag shared by the poller and the interactive session.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace finnews::application {

/**
 * @class ShutdownSignal
 * @brief Set once, never reset. Timed waiters wake up as soon as it is set.
 */
class ShutdownSignal {
public:
    /** @brief Sets the flag and wakes every waiter. Further calls are no-ops. */
    void trigger() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_set) return;
            m_set = true;
        }
        m_cv.notify_all();
    }

    bool isSet() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_set;
    }

    /**
     * @brief Blocks until the signal is set or the timeout elapses.
     * @return True if the signal is set.
     */
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this] { return m_set; });
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_set = false;
};

} // namespace finnews::application
