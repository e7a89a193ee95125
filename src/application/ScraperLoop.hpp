/**
 * @file ScraperLoop.hpp
 * @brief Background poller: crawl, deduplicate, persist, sleep.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include "application/NewsContext.hpp"
#include "domain/SeenRecord.hpp"

namespace finnews::application {

/**
 * @struct CycleReport
 * @brief What a single poll cycle did.
 */
struct CycleReport {
    size_t fetched = 0;    ///< Articles returned by the crawl.
    size_t added = 0;      ///< Links recorded in the seen store for the first time.
    size_t surfaced = 0;   ///< Already known links re-appended to the registry.
    bool persisted = false; ///< True if the seen store was written successfully this cycle.
};

/**
 * @class ScraperLoop
 * @brief Runs poll cycles until the shutdown signal is set.
 *
 * Polling -> Sleeping -> Polling ... -> Stopped. The sleep is a timed wait on
 * the shutdown signal, so setting it ends the loop without waiting out the interval.
 * A cycle in progress always completes before the signal is observed.
 */
class ScraperLoop {
public:
    enum class State { Idle, Polling, Sleeping, Stopped };

    using StatusCallback = std::function<void(const std::string&)>;
    using NowFunction = std::function<domain::TimePoint()>;

    /**
     * @param context Shared state.
     * @param interval Pause between cycles.
     * @param maxPages Page ceiling per cycle.
     * @param statusCallback Receives one line per notable event (may be null).
     * @param now Clock used to timestamp new records (defaults to the system clock).
     */
    ScraperLoop(NewsContext context,
                std::chrono::milliseconds interval,
                int maxPages,
                StatusCallback statusCallback = nullptr,
                NowFunction now = nullptr);
    ~ScraperLoop();

    ScraperLoop(const ScraperLoop&) = delete;
    ScraperLoop& operator=(const ScraperLoop&) = delete;

    /** @brief One crawl-merge-persist pass. Does not sleep. */
    CycleReport runCycle();

    /** @brief Cycles until shutdown, on the calling thread. */
    void run();

    /** @brief Starts run() on a worker thread. */
    void start();

    /** @brief Waits for the worker thread to observe shutdown and exit. */
    void join();

    State state() const { return m_state.load(); }
    int cyclesCompleted() const { return m_cycles.load(); }

private:
    void report(const std::string& line) const;

    NewsContext m_context;
    std::chrono::milliseconds m_interval;
    int m_maxPages;
    StatusCallback m_statusCallback;
    NowFunction m_now;
    bool m_persistPending = false; ///< Last save failed; only touched by the cycling thread.

    std::thread m_worker;
    std::atomic<State> m_state{State::Idle};
    std::atomic<int> m_cycles{0};
};

} // namespace finnews::application
