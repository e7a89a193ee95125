/**
 * @file InteractiveSession.hpp
 * @brief Foreground command loop for browsing and reading articles.
 */

#pragma once

#include <optional>
#include <string>
#include "application/NewsContext.hpp"
#include "application/SessionIo.hpp"

namespace finnews::application {

/**
 * @class InteractiveSession
 * @brief Welcome -> Listing(page) <-> Reading(article) -> Terminated.
 *
 * Commands in Listing: list, turn <n>, read <n>, home, quit.
 * Navigation replaces the shared registry; reading indexes into it as it is
 * at the moment the command runs. The listing is redrawn before each command
 * prompt. Going home keeps the current page.
 */
class InteractiveSession {
public:
    enum class State { Welcome, Listing, Reading, Terminated };

    InteractiveSession(NewsContext context, SessionView& view, CommandSource& input);

    /** @brief Shows the welcome screen and processes input until Terminated. */
    void run();

    /**
     * @brief Applies one input line to the current state.
     * @return The state after the line was handled.
     */
    State handleInput(const std::string& line);

    State state() const { return m_state; }
    int currentPage() const { return m_page; }

    /** @brief Article being read while in the Reading state. */
    const std::optional<domain::Article>& openArticle() const { return m_openArticle; }

private:
    void handleCommand(const std::string& line);
    void goHome();
    void showPage(int page);
    void readArticle(size_t index);
    void quit();

    NewsContext m_context;
    SessionView& m_view;
    CommandSource& m_input;

    State m_state = State::Welcome;
    int m_page = 1;
    std::optional<domain::Article> m_openArticle;
};

} // namespace finnews::application
