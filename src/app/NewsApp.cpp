/**
 * @file NewsApp.cpp
 * @brief Implementation of the NewsApp class.
 */
#include "app/NewsApp.hpp"

#include "application/InteractiveSession.hpp"
#include "application/ScraperLoop.hpp"
#include "infrastructure/ApaHtmlParser.hpp"
#include "infrastructure/HttpFetcher.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "ui/ConsoleInput.hpp"
#include "ui/ConsoleView.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <utility>

namespace finnews::app {

namespace {

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) {
    g_interrupted.store(true);
}

} // namespace

NewsApp::NewsApp(domain::AppConfig config) : m_config(std::move(config)) {}

void NewsApp::InstallSignalHandlers() {
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);
}

application::NewsContext NewsApp::CreateContext(const domain::AppConfig& config) {
    infrastructure::ListingRules rules;
    rules.sourceLabel = config.sourceLabel;
    rules.minTitleLength = static_cast<size_t>(config.minTitleLength);
    rules.excludedLinkMarkers = config.excludedLinkMarkers;

    auto fetcher = std::make_shared<infrastructure::HttpFetcher>(config.fetchTimeoutSeconds);
    auto parser = std::make_shared<infrastructure::ApaHtmlParser>(rules);

    application::NewsContext context;
    context.crawler = std::make_shared<application::PageCrawler>(
        fetcher, parser, config.baseUrl, static_cast<size_t>(config.articleCharLimit));
    context.seenStore = std::make_shared<infrastructure::SeenStore>(config.seenLogPath);
    context.registry = std::make_shared<application::ArticleRegistry>();
    context.shutdown = std::make_shared<application::ShutdownSignal>();
    return context;
}

size_t NewsApp::SeedRegistry(const application::NewsContext& context, const domain::AppConfig& config) {
    size_t seeded = 0;
    for (const auto& [link, record] : context.seenStore->recordsByAge()) {
        if (infrastructure::ApaHtmlParser::IsExcludedLink(link, config.excludedLinkMarkers)) continue;

        domain::Article article;
        article.title = record.title;
        article.link = link;
        article.source = config.sourceLabel;
        if (context.registry->appendIfAbsent(article)) ++seeded;
    }
    return seeded;
}

int NewsApp::Run() {
    InstallSignalHandlers();

    auto context = CreateContext(m_config);
    ui::ConsoleView view(std::cout);

    const auto retention = std::chrono::hours(24) * m_config.keepDays;
    const size_t loaded = context.seenStore->load(infrastructure::TimeUtils::Now(), retention);
    if (loaded > 0) {
        view.showStatus("Loaded " + std::to_string(loaded) + " seen articles from previous sessions.");
        SeedRegistry(context, m_config);
    } else {
        view.showStatus("No previous articles found, waiting for new ones...");
    }

    application::ScraperLoop scraper(
        context,
        std::chrono::seconds(m_config.scrapeIntervalSeconds),
        m_config.maxPages,
        [&view](const std::string& line) { view.showStatus(line); });
    scraper.start();

    ui::ConsoleInput input(view, *context.shutdown, [] { return g_interrupted.load(); });
    application::InteractiveSession session(context, view, input);
    session.run();

    // The session only ends through quit, end of input or an interruption,
    // all of which set the signal; make sure before waiting on the poller.
    context.shutdown->trigger();
    scraper.join();

    if (g_interrupted.load()) {
        std::cout << "Stopped by user." << std::endl;
    }
    return 0;
}

} // namespace finnews::app
