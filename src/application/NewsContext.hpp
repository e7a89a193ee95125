/**
 * @file NewsContext.hpp
 * @brief Shared state handed to both the background poller and the interactive session.
 */

#pragma once

#include <memory>
#include "application/ArticleRegistry.hpp"
#include "application/PageCrawler.hpp"
#include "application/ShutdownSignal.hpp"
#include "infrastructure/SeenStore.hpp"

namespace finnews::application {

/**
 * @struct NewsContext
 * @brief Owned by the coordinator; every member is internally synchronized.
 */
struct NewsContext {
    std::shared_ptr<PageCrawler> crawler;
    std::shared_ptr<infrastructure::SeenStore> seenStore;
    std::shared_ptr<ArticleRegistry> registry;
    std::shared_ptr<ShutdownSignal> shutdown;
};

} // namespace finnews::application
