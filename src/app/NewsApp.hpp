/**
 * @file NewsApp.hpp
 * @brief Main application class for FinNews.
 */

#pragma once

#include <memory>
#include <string>
#include "application/NewsContext.hpp"
#include "domain/AppConfig.hpp"

namespace finnews::app {

/**
 * @class NewsApp
 * @brief Owns the shared state and runs the poller next to the interactive session.
 */
class NewsApp {
public:
    explicit NewsApp(domain::AppConfig config);

    /**
     * @brief Loads history, starts the poller, runs the session, then waits for the poller.
     * @return Exit code (0 for success).
     */
    int Run();

    /**
     * @brief Builds the shared state with the production collaborators.
     */
    static application::NewsContext CreateContext(const domain::AppConfig& config);

    /**
     * @brief Fills the registry from the seen store, oldest first, skipping junk links.
     * @return Number of articles added.
     */
    static size_t SeedRegistry(const application::NewsContext& context, const domain::AppConfig& config);

private:
    /** @brief Routes SIGINT/SIGTERM to an async-signal-safe flag. */
    static void InstallSignalHandlers();

    domain::AppConfig m_config;
};

} // namespace finnews::app
