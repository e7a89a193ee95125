/**
 * @file ConsoleView.cpp
 * @brief Implementation of ConsoleView.
 */

#include "ui/ConsoleView.hpp"
#include "ui/Ansi.hpp"
#include "infrastructure/TextUtils.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <ostream>

namespace finnews::ui {

using infrastructure::TextUtils;

namespace {

constexpr size_t kTitleWidth = 72;
constexpr size_t kDateWidth = 18;
constexpr size_t kSourceWidth = 8;

// Pads or truncates to a fixed number of code points.
std::string Fit(const std::string& text, size_t width) {
    size_t length = TextUtils::Utf8Length(text);
    if (length > width) {
        return TextUtils::Utf8Truncate(text, width - 3) + "...";
    }
    return text + std::string(width - length, ' ');
}

std::string Rule(size_t width) {
    return std::string(width, '-');
}

} // namespace

ConsoleView::ConsoleView(std::ostream& out, bool useColor)
    : m_out(out), m_useColor(useColor) {}

const char* ConsoleView::style(const char* code) const {
    return m_useColor ? code : "";
}

void ConsoleView::clear() {
    if (m_useColor) m_out << ansi::clearScreen;
}

void ConsoleView::renderHeader() {
    m_out << style(ansi::bold) << style(ansi::cyan)
          << "+---------------------------------------+\n"
          << "|   A z F i n N e w s                   |\n"
          << "+---------------------------------------+\n"
          << style(ansi::reset)
          << style(ansi::bold) << style(ansi::yellow)
          << "  Actual Financial News of Azerbaijan\n"
          << style(ansi::reset) << "\n";
}

void ConsoleView::showWelcome() {
    std::lock_guard<std::mutex> lock(m_mutex);
    clear();
    renderHeader();
    m_out << style(ansi::bold) << style(ansi::green) << "Welcome to AzFinNews!" << style(ansi::reset) << "\n\n"
          << "Live updates from the APA.az Economy section. The tool keeps\n"
          << "monitoring the listing and remembers recent articles between runs.\n\n"
          << style(ansi::bold) << style(ansi::cyan) << "Available Commands:" << style(ansi::reset) << "\n"
          << "  list        Show the latest news (same as turn 1)\n"
          << "  read <n>    Open and read article number n\n"
          << "  turn <page> Browse older pages of the economy section\n"
          << "  home        Return to this welcome screen\n"
          << "  quit        Exit the application safely\n\n"
          << style(ansi::dim) << "New articles are picked up in the background." << style(ansi::reset) << "\n";
    m_out.flush();
}

void ConsoleView::showListing(int page, const std::vector<domain::Article>& articles) {
    std::lock_guard<std::mutex> lock(m_mutex);
    clear();
    renderHeader();

    std::string stamp = infrastructure::TimeUtils::ToIsoString(infrastructure::TimeUtils::Now()).substr(0, 19);
    stamp[10] = ' ';
    m_out << style(ansi::bold) << style(ansi::green)
          << "AzFinNews - Page " << page << " - " << stamp << style(ansi::reset) << "\n";

    const size_t width = 5 + kTitleWidth + 3 + kDateWidth + 3 + kSourceWidth;
    m_out << style(ansi::muted) << Rule(width) << style(ansi::reset) << "\n";
    m_out << style(ansi::bold) << style(ansi::magenta)
          << "  No. " << Fit("Title", kTitleWidth) << " | " << Fit("Time & Date", kDateWidth)
          << " | " << Fit("Source", kSourceWidth) << style(ansi::reset) << "\n";
    m_out << style(ansi::muted) << Rule(width) << style(ansi::reset) << "\n";

    if (articles.empty()) {
        m_out << style(ansi::dim) << "  No articles yet, waiting for new ones..." << style(ansi::reset) << "\n";
    }
    for (size_t i = 0; i < articles.size(); ++i) {
        const auto& a = articles[i];
        std::string number = std::to_string(i + 1);
        if (number.size() < 4) number.insert(0, 4 - number.size(), ' ');
        m_out << style(ansi::cyan) << number << style(ansi::reset) << " "
              << style(ansi::bold) << style(ansi::yellow) << Fit(a.title, kTitleWidth) << style(ansi::reset)
              << " | " << style(ansi::dim) << Fit(a.displayDate, kDateWidth) << style(ansi::reset)
              << " | " << style(ansi::blue) << Fit(a.source.empty() ? "-" : a.source, kSourceWidth)
              << style(ansi::reset) << "\n";
    }
    m_out << style(ansi::muted) << Rule(width) << style(ansi::reset) << "\n";
    m_out << style(ansi::dim) << "Commands: list | read <n> | turn <page> | home | quit" << style(ansi::reset) << "\n";
    m_out.flush();
}

void ConsoleView::showArticle(const domain::Article& article, const std::string& body) {
    std::lock_guard<std::mutex> lock(m_mutex);
    clear();
    renderHeader();
    m_out << style(ansi::bold) << article.title << style(ansi::reset) << "\n"
          << style(ansi::dim) << article.displayDate << " | " << article.source << style(ansi::reset) << "\n"
          << style(ansi::blue) << article.link << style(ansi::reset) << "\n"
          << style(ansi::muted) << Rule(80) << style(ansi::reset) << "\n\n"
          << body << "\n\n"
          << style(ansi::muted) << Rule(80) << style(ansi::reset) << "\n";
    m_out.flush();
}

void ConsoleView::showMessage(application::MessageLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const char* color = ansi::yellow;
    if (level == application::MessageLevel::Error) color = ansi::red;
    m_out << style(color) << message << style(ansi::reset) << "\n";
    m_out.flush();
}

void ConsoleView::showStatus(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const bool isNew = line.rfind("+ ", 0) == 0;
    m_out << style(isNew ? ansi::green : ansi::dim) << line << style(ansi::reset) << "\n";
    m_out.flush();
}

void ConsoleView::showPrompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << style(ansi::bold) << style(ansi::green) << prompt << style(ansi::reset) << ": ";
    m_out.flush();
}

} // namespace finnews::ui
