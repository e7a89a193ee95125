/**
 * @file ScraperLoop.cpp
 * @brief Implementation of ScraperLoop.
 */

#include "application/ScraperLoop.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <utility>

namespace finnews::application {

ScraperLoop::ScraperLoop(NewsContext context,
                         std::chrono::milliseconds interval,
                         int maxPages,
                         StatusCallback statusCallback,
                         NowFunction now)
    : m_context(std::move(context)),
      m_interval(interval),
      m_maxPages(maxPages),
      m_statusCallback(std::move(statusCallback)),
      m_now(now ? std::move(now) : NowFunction(&infrastructure::TimeUtils::Now)) {}

ScraperLoop::~ScraperLoop() {
    if (m_worker.joinable()) {
        m_context.shutdown->trigger();
        m_worker.join();
    }
}

void ScraperLoop::report(const std::string& line) const {
    if (m_statusCallback) m_statusCallback(line);
}

CycleReport ScraperLoop::runCycle() {
    CycleReport cycle;
    auto found = m_context.crawler->crawlAllPages(m_maxPages);
    cycle.fetched = found.size();

    for (const auto& item : found) {
        // add() is the check-and-insert, so a link is only ever counted once
        if (m_context.seenStore->add(item.link, item.title, m_now())) {
            m_context.registry->appendIfAbsent(item);
            report("+ New: " + item.title);
            ++cycle.added;
        } else if (m_context.registry->appendIfAbsent(item)) {
            ++cycle.surfaced;
        }
    }

    if (cycle.added == 0) {
        report("[" + infrastructure::TimeUtils::ToClockString(m_now()) + "] No new articles.");
    }

    // A failed save stays pending and is retried every cycle until it succeeds
    if (cycle.added > 0 || m_persistPending) {
        cycle.persisted = m_context.seenStore->persist();
        m_persistPending = !cycle.persisted;
        if (m_persistPending) {
            report("Could not save " + m_context.seenStore->path() + ", will retry next cycle.");
        }
    }

    ++m_cycles;
    return cycle;
}

void ScraperLoop::run() {
    while (!m_context.shutdown->isSet()) {
        m_state = State::Polling;
        runCycle();

        m_state = State::Sleeping;
        if (m_context.shutdown->waitFor(m_interval)) {
            break;
        }
    }
    m_state = State::Stopped;
}

void ScraperLoop::start() {
    if (m_worker.joinable()) return;
    m_worker = std::thread(&ScraperLoop::run, this);
}

void ScraperLoop::join() {
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

} // namespace finnews::application
