/**
 * @file InteractiveSession.cpp
 * @brief Implementation of InteractiveSession.
 */

#include "application/InteractiveSession.hpp"
#include "infrastructure/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

namespace finnews::application {

using infrastructure::TextUtils;

namespace {

// Positive integers only; rejects signs, blanks and values that do not fit.
std::optional<int> ParsePositive(const std::string& token) {
    if (token.empty() || token.size() > 9) return std::nullopt;
    if (!std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int value = std::stoi(token);
    if (value <= 0) return std::nullopt;
    return value;
}

std::vector<std::string> Tokenize(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> parts;
    std::string part;
    while (ss >> part) parts.push_back(part);
    return parts;
}

} // namespace

InteractiveSession::InteractiveSession(NewsContext context, SessionView& view, CommandSource& input)
    : m_context(std::move(context)), m_view(view), m_input(input) {}

void InteractiveSession::run() {
    goHome();

    while (m_state != State::Terminated) {
        if (m_context.shutdown->isSet()) {
            m_state = State::Terminated;
            break;
        }

        std::string prompt;
        switch (m_state) {
            case State::Welcome:
                prompt = "Press Enter to load the latest financial news";
                break;
            case State::Reading:
                prompt = "Press Enter to return";
                break;
            default:
                // Redrawn before every command so poller additions are visible
                m_view.showListing(m_page, m_context.registry->snapshot());
                prompt = "Command";
                break;
        }

        auto line = m_input.nextLine(prompt);
        if (!line) {
            quit();
            break;
        }
        handleInput(*line);
    }
}

InteractiveSession::State InteractiveSession::handleInput(const std::string& line) {
    switch (m_state) {
        case State::Welcome:
            // Acknowledgement only; the registry and page are left as they were.
            m_state = State::Listing;
            break;
        case State::Reading:
            m_openArticle.reset();
            m_state = State::Listing;
            break;
        case State::Listing:
            handleCommand(line);
            break;
        case State::Terminated:
            break;
    }
    return m_state;
}

void InteractiveSession::handleCommand(const std::string& line) {
    const auto parts = Tokenize(TextUtils::ToLower(TextUtils::Trim(line)));
    if (parts.empty()) {
        m_view.showMessage(MessageLevel::Warning, "Unknown command");
        return;
    }

    const std::string& verb = parts[0];
    if (verb == "quit" && parts.size() == 1) {
        quit();
    } else if (verb == "home" && parts.size() == 1) {
        goHome();
    } else if (verb == "list" && parts.size() == 1) {
        m_view.showMessage(MessageLevel::Info, "Loading the latest news (page 1)...");
        showPage(1);
    } else if (verb == "turn") {
        auto page = parts.size() == 2 ? ParsePositive(parts[1]) : std::nullopt;
        if (!page) {
            m_view.showMessage(MessageLevel::Error, "Usage: turn <page_number>");
            return;
        }
        m_view.showMessage(MessageLevel::Info, "Turning to page " + std::to_string(*page) + "...");
        showPage(*page);
    } else if (verb == "read") {
        auto number = parts.size() == 2 ? ParsePositive(parts[1]) : std::nullopt;
        if (!number) {
            m_view.showMessage(MessageLevel::Error, "Usage: read <n>");
            return;
        }
        readArticle(static_cast<size_t>(*number - 1));
    } else {
        m_view.showMessage(MessageLevel::Warning, "Unknown command");
    }
}

void InteractiveSession::goHome() {
    m_state = State::Welcome;
    m_view.showWelcome();
}

void InteractiveSession::showPage(int page) {
    auto items = m_context.crawler->crawlPage(page);
    if (items.empty()) {
        if (page == 1) {
            m_view.showMessage(MessageLevel::Warning, "Could not load the latest news, keeping the current list.");
        } else {
            m_view.showMessage(MessageLevel::Error, "No articles found on that page.");
        }
        return;
    }
    m_context.registry->replaceAll(items);
    m_page = page;
}

void InteractiveSession::readArticle(size_t index) {
    auto article = m_context.registry->at(index);
    if (!article) {
        m_view.showMessage(MessageLevel::Error, "Invalid index");
        return;
    }

    auto body = m_context.crawler->loadArticleBody(*article);
    if (!body) {
        m_view.showMessage(MessageLevel::Error, "Could not load the article, try again later.");
        return;
    }

    m_openArticle = *article;
    m_state = State::Reading;
    m_view.showArticle(*article, *body);
}

void InteractiveSession::quit() {
    m_view.showMessage(MessageLevel::Info, "Exiting...");
    m_context.shutdown->trigger();
    m_state = State::Terminated;
}

} // namespace finnews::application
