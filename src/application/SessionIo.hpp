/**
 * @file SessionIo.hpp
 * @brief Presentation and input ports used by the interactive session.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Article.hpp"

namespace finnews::application {

enum class MessageLevel { Info, Warning, Error };

/**
 * @class SessionView
 * @brief Renders session screens. Implementations own all formatting.
 */
class SessionView {
public:
    virtual ~SessionView() = default;

    virtual void showWelcome() = 0;
    virtual void showListing(int page, const std::vector<domain::Article>& articles) = 0;
    virtual void showArticle(const domain::Article& article, const std::string& body) = 0;
    virtual void showMessage(MessageLevel level, const std::string& message) = 0;
};

/**
 * @class CommandSource
 * @brief Supplies one line of user input at a time.
 */
class CommandSource {
public:
    virtual ~CommandSource() = default;

    /**
     * @brief Blocks until a full line is available.
     * @param prompt Text shown to the user.
     * @return The line without its terminator, or nullopt on end of input or interruption.
     */
    virtual std::optional<std::string> nextLine(const std::string& prompt) = 0;
};

} // namespace finnews::application
