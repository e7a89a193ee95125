#include "ui/ConsoleInput.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace finnews::ui {

ConsoleInput::ConsoleInput(ConsoleView& view,
                           application::ShutdownSignal& shutdown,
                           InterruptCheck interrupted,
                           int pollIntervalMs)
    : m_view(view),
      m_shutdown(shutdown),
      m_interrupted(std::move(interrupted)),
      m_pollIntervalMs(pollIntervalMs) {}

bool ConsoleInput::waitReadable() {
    while (true) {
        if (m_interrupted && m_interrupted()) {
            m_shutdown.trigger();
            return false;
        }
        if (m_shutdown.isSet()) return false;

        // Lines already buffered by std::cin would not show up in poll()
        if (std::cin.rdbuf()->in_avail() > 0) return true;

        pollfd fd{STDIN_FILENO, POLLIN, 0};
        int rc = ::poll(&fd, 1, m_pollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ConsoleInput] poll failed, errno " << errno << std::endl;
            return true; // fall back to a plain blocking read
        }
        if (rc > 0) return true; // readable, hang-up or error: getline sorts it out
    }
}

std::optional<std::string> ConsoleInput::nextLine(const std::string& prompt) {
    m_view.showPrompt(prompt);
    if (!waitReadable()) {
        std::cout << std::endl;
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}

} // namespace finnews::ui
