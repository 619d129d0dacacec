#include "reader/CommandChannel.h"

#include <chrono>
#include <thread>

namespace CartLink::Reader {

CommandChannel::CommandChannel(IO::Transport& transport)
    : Loggable(Common::LogCategory::Channel), m_transport(transport) {
    m_sleeper = [](uint32_t microseconds) {
        std::this_thread::sleep_for(std::chrono::microseconds(microseconds));
    };
}

bool CommandChannel::Send(const ReaderCommand& command) {
    if (m_failed) return false;

    if (m_observer) m_observer(command);

    if (m_trace && !std::holds_alternative<ContinueCommand>(command)) {
        LogDebug("%s", Describe(command).c_str());
    }

    if (const auto* sleep = std::get_if<SleepCommand>(&command)) {
        m_sleeper(sleep->microseconds);
        return true;
    }

    if (!m_transport.Send(Encode(command))) {
        LogError("Send failed: %s", Describe(command).c_str());
        m_failed = true;
        return false;
    }
    return true;
}

bool CommandChannel::SendAll(const CommandList& commands) {
    for (const auto& command : commands) {
        if (!Send(command)) return false;
    }
    return true;
}

void CommandChannel::CloseConnection() {
    m_transport.Close();
}

void CommandChannel::SetSleeper(Sleeper sleeper) {
    if (!sleeper) {
        sleeper = [](uint32_t microseconds) {
            std::this_thread::sleep_for(std::chrono::microseconds(microseconds));
        };
    }
    m_sleeper = std::move(sleeper);
}

void CommandChannel::SetObserver(Observer observer) {
    m_observer = std::move(observer);
}

} // namespace CartLink::Reader
