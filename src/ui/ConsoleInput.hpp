/**
 * @file ConsoleInput.hpp
 * @brief Line input from stdin that stays responsive to shutdown.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include "application/SessionIo.hpp"
#include "application/ShutdownSignal.hpp"
#include "ui/ConsoleView.hpp"

namespace finnews::ui {

/**
 * @class ConsoleInput
 * @brief Reads std::cin, waking every poll interval to check for interruption.
 *
 * An interruption (the flag set by the signal handler) is promoted to the
 * shared shutdown signal, and nextLine() returns nullopt.
 */
class ConsoleInput : public application::CommandSource {
public:
    using InterruptCheck = std::function<bool()>;

    ConsoleInput(ConsoleView& view,
                 application::ShutdownSignal& shutdown,
                 InterruptCheck interrupted,
                 int pollIntervalMs = 200);

    std::optional<std::string> nextLine(const std::string& prompt) override;

private:
    /** @brief Waits until stdin has data. False on interruption or shutdown. */
    bool waitReadable();

    ConsoleView& m_view;
    application::ShutdownSignal& m_shutdown;
    InterruptCheck m_interrupted;
    int m_pollIntervalMs;
};

} // namespace finnews::ui
