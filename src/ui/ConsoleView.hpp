/**
 * @file ConsoleView.hpp
 * @brief ANSI terminal rendering of the session screens.
 */

#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include "application/SessionIo.hpp"

namespace finnews::ui {

/**
 * @class ConsoleView
 * @brief SessionView writing to an output stream.
 *
 * Also receives poller status lines; both paths share one mutex so lines
 * from the two threads never interleave mid-line.
 */
class ConsoleView : public application::SessionView {
public:
    /**
     * @param out Destination stream (normally std::cout).
     * @param useColor Emit ANSI escapes and clear the screen between pages.
     */
    explicit ConsoleView(std::ostream& out, bool useColor = true);

    void showWelcome() override;
    void showListing(int page, const std::vector<domain::Article>& articles) override;
    void showArticle(const domain::Article& article, const std::string& body) override;
    void showMessage(application::MessageLevel level, const std::string& message) override;

    /** @brief Prints a background status line ("+ New: ..."). */
    void showStatus(const std::string& line);

    /** @brief Prints the prompt without a line break. */
    void showPrompt(const std::string& prompt);

private:
    void renderHeader();
    void clear();
    const char* style(const char* code) const;

    std::ostream& m_out;
    bool m_useColor;
    std::mutex m_mutex;
};

} // namespace finnews::ui
